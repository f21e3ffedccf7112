#include "usb_pd.h"

#include "stusb4500_nvm_settings.h"
#include "esp_check.h"
#include "esp_log.h"

static const char* TAG = "usb_pd";

usb_pd_profile_t usb_pd_default_profile()
{
    usb_pd_profile_t profile = {
        .pdo_count = 3,
        .pdo = {
            { .voltage_mv = 5000, .current_ma = 3000 },
            { .voltage_mv = 15000, .current_ma = 3000 },
            { .voltage_mv = 20000, .current_ma = 5000 },
        },
        .usb_comm_capable = true,
        .external_power = true,
    };
    return profile;
}

esp_err_t usb_pd_init(STUSB4500& device)
{
    ESP_RETURN_ON_ERROR(device.begin(), TAG, "Failed to initialize STUSB4500");

    bool changed = false;
    ESP_RETURN_ON_ERROR(usb_pd_apply_profile(device, usb_pd_default_profile(), &changed),
        TAG, "Failed to provision sink profile");

    if (changed) {
        ESP_LOGI(TAG, "Sink profile written to NVM");
    }
    return ESP_OK;
}

// Locks the session and reports the first error of the operation and the lock
static esp_err_t finish_session(NvmSession& session, esp_err_t ret)
{
    esp_err_t lock_ret = session.lock();
    if (ret != ESP_OK) {
        return ret;
    }
    return lock_ret;
}

esp_err_t usb_pd_dump_nvm(STUSB4500& device, uint8_t blob[STUSB4500_NVM_IMAGE_SIZE])
{
    if (blob == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE];
    NvmSession session;
    ESP_RETURN_ON_ERROR(device.unlockNvm(&session), TAG, "Failed to unlock NVM");

    esp_err_t ret = finish_session(session, session.readSectors(sectors));
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "NVM dump failed: %s", esp_err_to_name(ret));
        return ret;
    }

    return nvmImageToBlob(sectors, blob, STUSB4500_NVM_IMAGE_SIZE);
}

esp_err_t usb_pd_restore_nvm(STUSB4500& device, const uint8_t* blob, size_t len)
{
    uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE];
    ESP_RETURN_ON_ERROR(nvmImageFromBlob(blob, len, sectors), TAG, "Invalid NVM image");

    NvmSession session;
    ESP_RETURN_ON_ERROR(device.unlockNvm(&session), TAG, "Failed to unlock NVM");

    esp_err_t ret = finish_session(session, session.writeSectors(sectors));
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "NVM restore failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ESP_LOGI(TAG, "NVM image restored");
    return ESP_OK;
}

esp_err_t usb_pd_factory_reset(STUSB4500& device)
{
    NvmSession session;
    ESP_RETURN_ON_ERROR(device.unlockNvm(&session), TAG, "Failed to unlock NVM");

    esp_err_t ret = finish_session(session, session.writeSectors(NvmSession::factory_defaults));
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Factory reset failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ESP_LOGI(TAG, "NVM reset to factory defaults");
    return ESP_OK;
}

static bool profile_matches(const NvmSettings& settings, const usb_pd_profile_t& profile)
{
    if (settings.pdo_count != profile.pdo_count ||
        settings.usb_comm_capable != profile.usb_comm_capable ||
        settings.external_power != profile.external_power) {
        return false;
    }

    for (int i = 0; i < STUSB4500_PDO_CHANNEL_COUNT; i++) {
        if (settings.pdo[i].voltage_mv != profile.pdo[i].voltage_mv ||
            settings.pdo[i].current_ma != profile.pdo[i].current_ma) {
            ESP_LOGD(TAG, "PDO%d differs: stored %lu mV/%lu mA", i + 1,
                (unsigned long)settings.pdo[i].voltage_mv, (unsigned long)settings.pdo[i].current_ma);
            return false;
        }
    }
    return true;
}

esp_err_t usb_pd_apply_profile(STUSB4500& device, const usb_pd_profile_t& profile, bool* changed)
{
    if (changed == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    *changed = false;

    uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE];
    NvmSession session;
    ESP_RETURN_ON_ERROR(device.unlockNvm(&session), TAG, "Failed to unlock NVM");

    esp_err_t ret = session.readSectors(sectors);
    if (ret != ESP_OK) {
        return finish_session(session, ret);
    }

    NvmSettings settings;
    ret = nvmDecodeSettings(sectors, &settings);
    if (ret != ESP_OK) {
        return finish_session(session, ret);
    }

    if (profile_matches(settings, profile)) {
        ESP_LOGI(TAG, "NVM already holds the requested sink profile");
        return finish_session(session, ESP_OK);
    }

    settings.pdo_count = profile.pdo_count;
    settings.usb_comm_capable = profile.usb_comm_capable;
    settings.external_power = profile.external_power;
    for (int i = 0; i < STUSB4500_PDO_CHANNEL_COUNT; i++) {
        settings.pdo[i].voltage_mv = profile.pdo[i].voltage_mv;
        settings.pdo[i].current_ma = profile.pdo[i].current_ma;
    }

    ret = nvmEncodeSettings(settings, sectors);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Sink profile cannot be stored in NVM");
        return finish_session(session, ret);
    }

    ret = finish_session(session, session.writeSectors(sectors));
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to program NVM: %s", esp_err_to_name(ret));
        return ret;
    }
    *changed = true;

    return device.softReset();
}

static void log_pdo(stusb4500_pdo_channel_t channel, const Pdo& pdo)
{
    FixedPdo fixed(pdo.bits());
    VariablePdo variable(pdo.bits());
    BatteryPdo battery(pdo.bits());
    AugmentedPdo augmented(pdo.bits());

    switch (pdo.type()) {
    case PdoType::Fixed:
        ESP_LOGI(TAG, "PDO %d: Fixed %lu mV / %lu mA, FRS %s", channel,
            (unsigned long)fixed.voltage() * STUSB4500_PDO_VOLTAGE_LSB_MV,
            (unsigned long)fixed.current() * STUSB4500_PDO_CURRENT_LSB_MA,
            fastSwapToString(fixed.fastRoleSwap()));
        break;
    case PdoType::Variable:
        ESP_LOGI(TAG, "PDO %d: Variable %lu-%lu mV / %lu mA", channel,
            (unsigned long)variable.minVoltage() * STUSB4500_PDO_VOLTAGE_LSB_MV,
            (unsigned long)variable.maxVoltage() * STUSB4500_PDO_VOLTAGE_LSB_MV,
            (unsigned long)variable.current() * STUSB4500_PDO_CURRENT_LSB_MA);
        break;
    case PdoType::Battery:
        ESP_LOGI(TAG, "PDO %d: Battery %lu-%lu mV / %lu mW", channel,
            (unsigned long)battery.minVoltage() * STUSB4500_PDO_VOLTAGE_LSB_MV,
            (unsigned long)battery.maxVoltage() * STUSB4500_PDO_VOLTAGE_LSB_MV,
            (unsigned long)battery.power() * STUSB4500_PDO_POWER_LSB_MW);
        break;
    case PdoType::Augmented:
        ESP_LOGI(TAG, "PDO %d: PPS %lu-%lu mV / %lu mA", channel,
            (unsigned long)augmented.minVoltage() * STUSB4500_APDO_VOLTAGE_LSB_MV,
            (unsigned long)augmented.maxVoltage() * STUSB4500_APDO_VOLTAGE_LSB_MV,
            (unsigned long)augmented.maxCurrent() * STUSB4500_APDO_CURRENT_LSB_MA);
        break;
    }
}

esp_err_t usb_pd_log_status(STUSB4500& device)
{
    stusb4500_negotiation_status_t status;
    ESP_RETURN_ON_ERROR(device.readNegotiationStatus(&status), TAG, "Failed to read status");

    ESP_LOGI(TAG, "=== STUSB4500 Status ===");
    ESP_LOGI(TAG, "Device ID: 0x%02X", status.device_id);
    ESP_LOGI(TAG, "Connected: %s", status.is_connected ? "Yes" : "No");
    ESP_LOGI(TAG, "PD Contract: %s", status.pd_negotiation_complete ? "Active" : "None");
    ESP_LOGI(TAG, "CC1: %s", STUSB4500::ccStateToString(status.cc_status.cc1_state));
    ESP_LOGI(TAG, "CC2: %s", STUSB4500::ccStateToString(status.cc_status.cc2_state));
    ESP_LOGI(TAG, "FSM: %s", STUSB4500::typecFsmStateToString(status.pd_typec_status.fsm_state));

    uint8_t pdo_count = 0;
    ESP_RETURN_ON_ERROR(device.getPdoCount(&pdo_count), TAG, "Failed to read PDO count");
    ESP_LOGI(TAG, "Sink PDOs: %u", pdo_count);

    for (int i = 1; i <= STUSB4500_PDO_CHANNEL_COUNT; i++) {
        stusb4500_pdo_channel_t channel = (stusb4500_pdo_channel_t)i;
        Pdo pdo;
        ESP_RETURN_ON_ERROR(device.getPdo(channel, &pdo), TAG, "Failed to read PDO %d", i);
        log_pdo(channel, pdo);
    }

    Rdo rdo;
    ESP_RETURN_ON_ERROR(device.getCurrentRdo(&rdo), TAG, "Failed to read RDO");
    if (rdo.position() == 0) {
        ESP_LOGI(TAG, "RDO: no contract");
    }
    else {
        ESP_LOGI(TAG, "RDO: PDO %u, %lu mA (max %lu mA)%s", rdo.position(),
            (unsigned long)rdo.operatingCurrent() * STUSB4500_PDO_CURRENT_LSB_MA,
            (unsigned long)rdo.maxOperatingCurrent() * STUSB4500_PDO_CURRENT_LSB_MA,
            rdo.capabilityMismatch() ? ", capability mismatch" : "");
    }

    uint16_t voltage_mv = 0;
    ESP_RETURN_ON_ERROR(device.readVoltage(&voltage_mv), TAG, "Failed to read VBUS");
    ESP_LOGI(TAG, "VBUS: %u mV", voltage_mv);

    return ESP_OK;
}
