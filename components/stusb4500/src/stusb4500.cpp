#include "stusb4500.h"

#include "esp_log.h"

static const char* TAG = "STUSB4500";

STUSB4500::STUSB4500(RegisterBus& bus)
    : bus_(bus)
{
}

esp_err_t STUSB4500::begin()
{
    uint8_t device_id = 0;
    esp_err_t ret = ESP_ERR_INVALID_RESPONSE;

    for (int attempt = 0; attempt < 3; attempt++) {
        ret = readDeviceId(&device_id);
        if (ret == ESP_OK && device_id != 0) {
            break;
        }
        ESP_LOGD(TAG, "Device ID read attempt %d/3 failed: %s", attempt + 1, esp_err_to_name(ret));
        bus_.delayMs(10);
    }

    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to read device ID: %s", esp_err_to_name(ret));
        return ret;
    }

    if (!isSupportedDeviceId(device_id)) {
        ESP_LOGE(TAG, "Invalid device ID: 0x%02X (expected 0x%02X or 0x%02X)",
            device_id, STUSB4500_EVAL_DEVICE_ID, STUSB4500_PROD_DEVICE_ID);
        return ESP_ERR_NOT_FOUND;
    }

    ret = clearAlertStatus();
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Failed to clear alert status: %s", esp_err_to_name(ret));
    }

    ESP_LOGI(TAG, "STUSB4500 detected (Device ID: 0x%02X)", device_id);
    return ESP_OK;
}

esp_err_t STUSB4500::readDeviceId(uint8_t* device_id)
{
    if (device_id == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    return readRegister(STUSB4500_REG_DEVICE_ID, device_id);
}

bool STUSB4500::isSupportedDeviceId(uint8_t device_id)
{
    return device_id == STUSB4500_EVAL_DEVICE_ID || device_id == STUSB4500_PROD_DEVICE_ID;
}

esp_err_t STUSB4500::unlockNvm(NvmSession* session, const NvmConfig& config)
{
    if (session == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    if (nvm_unlocked_) {
        ESP_LOGE(TAG, "NVM session already open");
        return ESP_ERR_INVALID_STATE;
    }
    if (session->isUnlocked()) {
        return ESP_ERR_INVALID_STATE;
    }

    return session->unlock(*this, config);
}

esp_err_t STUSB4500::getPdoCount(uint8_t* pdo_count)
{
    if (pdo_count == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t ret = readRegister(STUSB4500_REG_DPM_PDO_NUMB, pdo_count);
    if (ret == ESP_OK) {
        *pdo_count = *pdo_count & STUSB4500_DPM_PDO_NUMB_MASK;
    }
    return ret;
}

esp_err_t STUSB4500::setPdoCount(uint8_t pdo_count)
{
    esp_err_t ret = checkAvailable();
    if (ret != ESP_OK) return ret;

    if (pdo_count > STUSB4500_PDO_CHANNEL_COUNT) {
        pdo_count = STUSB4500_PDO_CHANNEL_COUNT;
    }

    return bus_.writeRegister(STUSB4500_REG_DPM_PDO_NUMB, pdo_count);
}

esp_err_t STUSB4500::getPdo(stusb4500_pdo_channel_t channel, Pdo* pdo)
{
    if (pdo == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    uint8_t reg = pdoRegister(channel);
    if (reg == 0) {
        return ESP_ERR_INVALID_ARG;
    }

    uint32_t raw = 0;
    esp_err_t ret = readWord(reg, &raw);
    if (ret != ESP_OK) return ret;

    *pdo = Pdo::fromBits(raw);
    return ESP_OK;
}

esp_err_t STUSB4500::setPdo(stusb4500_pdo_channel_t channel, const Pdo& pdo)
{
    uint8_t reg = pdoRegister(channel);
    if (reg == 0) {
        return ESP_ERR_INVALID_ARG;
    }

    return writeWord(reg, pdo.bits());
}

esp_err_t STUSB4500::getCurrentRdo(Rdo* rdo)
{
    if (rdo == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    uint32_t raw = 0;
    esp_err_t ret = readWord(STUSB4500_REG_RDO_REG_STATUS, &raw);
    if (ret != ESP_OK) return ret;

    *rdo = Rdo(raw);
    return ESP_OK;
}

esp_err_t STUSB4500::readVoltage(uint16_t* voltage_mv)
{
    if (voltage_mv == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t ret = checkAvailable();
    if (ret != ESP_OK) return ret;

    uint8_t vbus[2];
    ret = bus_.read(STUSB4500_REG_VBUS_VOLTAGE_LOW, vbus, sizeof(vbus));
    if (ret != ESP_OK) return ret;

    uint16_t code = (vbus[0] | (vbus[1] << 8)) & STUSB4500_VBUS_VOLTAGE_MASK;
    *voltage_mv = code * STUSB4500_VBUS_LSB_MV;

    ESP_LOGD(TAG, "VBUS code 0x%03X = %u mV", code, *voltage_mv);
    return ESP_OK;
}

esp_err_t STUSB4500::readNegotiationStatus(stusb4500_negotiation_status_t* status)
{
    if (status == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    stusb4500_negotiation_status_t result = {};
    esp_err_t ret = readDeviceId(&result.device_id);
    if (ret == ESP_OK) ret = readCcStatus(&result.cc_status);
    if (ret == ESP_OK) ret = readPdTypecStatus(&result.pd_typec_status);
    if (ret == ESP_OK) ret = readPrtStatus(&result.prt_status);
    if (ret == ESP_OK) ret = readRegister(STUSB4500_REG_PE_FSM, &result.pe_fsm_state);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to read negotiation status: %s", esp_err_to_name(ret));
        return ret;
    }

    // Attached with Rp seen on at least one CC line
    bool rp_detected = result.cc_status.cc1_state != STUSB4500_CC_STATE_NOT_IN_UFP ||
        result.cc_status.cc2_state != STUSB4500_CC_STATE_NOT_IN_UFP;
    result.is_connected = result.cc_status.connection_result && rp_detected;
    result.pd_negotiation_complete = result.prt_status.pd_contract_active;

    *status = result;
    return ESP_OK;
}

static inline bool flagSet(uint8_t value, uint8_t mask)
{
    return (value & mask) != 0;
}

esp_err_t STUSB4500::readCcStatus(stusb4500_cc_status_t* status)
{
    if (status == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    uint8_t value = 0;
    esp_err_t ret = readRegister(STUSB4500_REG_CC_STATUS, &value);
    if (ret != ESP_OK) return ret;

    status->cc1_state = static_cast<stusb4500_cc_state_t>(value & STUSB4500_CC_STATUS_CC1_STATE_MASK);
    status->cc2_state = static_cast<stusb4500_cc_state_t>(
        (value & STUSB4500_CC_STATUS_CC2_STATE_MASK) >> STUSB4500_CC_STATUS_CC2_STATE_SHIFT);
    status->connection_result = flagSet(value, STUSB4500_CC_STATUS_CONNECT_RESULT);
    status->looking_for_connection = flagSet(value, STUSB4500_CC_STATUS_LOOKING4CONNECTION);
    return ESP_OK;
}

esp_err_t STUSB4500::readPdTypecStatus(stusb4500_pd_typec_status_t* status)
{
    if (status == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    uint8_t value = 0;
    esp_err_t ret = readRegister(STUSB4500_REG_PD_TYPEC_STATUS, &value);
    if (ret != ESP_OK) return ret;

    status->pd_typec_handshake_check = flagSet(value, STUSB4500_PD_TYPEC_STATUS_PD_TYPEC_HAND_CHECK);
    status->fsm_state = static_cast<stusb4500_typec_fsm_state_t>(value & STUSB4500_PD_TYPEC_STATUS_TYPEC_FSM_STATE_MASK);
    return ESP_OK;
}

esp_err_t STUSB4500::readPrtStatus(stusb4500_prt_status_t* status)
{
    if (status == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    uint8_t value = 0;
    esp_err_t ret = readRegister(STUSB4500_REG_PRT_STATUS, &value);
    if (ret != ESP_OK) return ret;

    status->hw_reset_received = flagSet(value, STUSB4500_PRT_STATUS_HWRESET_RECEIVED);
    status->soft_reset_received = flagSet(value, STUSB4500_PRT_STATUS_SOFTRESET_RECEIVED);
    status->data_role_sink = flagSet(value, STUSB4500_PRT_STATUS_DATAROLE);
    status->power_role_sink = flagSet(value, STUSB4500_PRT_STATUS_POWERROLE);
    status->pd_contract_active = flagSet(value, STUSB4500_PRT_STATUS_PD_CONTRACT);
    status->startup_power = flagSet(value, STUSB4500_PRT_STATUS_STARTUP_POWER);
    status->message_received = flagSet(value, STUSB4500_PRT_STATUS_MSG_RECEIVED);
    status->message_sent = flagSet(value, STUSB4500_PRT_STATUS_MSG_SENT);
    return ESP_OK;
}

esp_err_t STUSB4500::clearAlertStatus()
{
    // Clear-on-read
    uint8_t discard = 0;
    return readRegister(STUSB4500_REG_ALERT_STATUS_1, &discard);
}

esp_err_t STUSB4500::softReset()
{
    esp_err_t ret = checkAvailable();
    if (ret != ESP_OK) return ret;

    ESP_LOGI(TAG, "Performing soft reset");

    ret = bus_.writeRegister(STUSB4500_REG_TX_HEADER_LOW, STUSB4500_TX_HEADER_SOFT_RESET);
    if (ret != ESP_OK) return ret;

    ret = bus_.writeRegister(STUSB4500_REG_PD_COMMAND_CTRL, STUSB4500_PD_COMMAND_SEND);
    if (ret != ESP_OK) return ret;

    bus_.delayMs(100);
    return ESP_OK;
}

const char* STUSB4500::ccStateToString(stusb4500_cc_state_t state)
{
    switch (state) {
    case STUSB4500_CC_STATE_NOT_IN_UFP: return "Not in UFP";
    case STUSB4500_CC_STATE_DEFAULT_USB: return "Default USB";
    case STUSB4500_CC_STATE_POWER_1_5A: return "1.5A";
    case STUSB4500_CC_STATE_POWER_3_0A: return "3.0A";
    default: return "Unknown";
    }
}

const char* STUSB4500::typecFsmStateToString(stusb4500_typec_fsm_state_t state)
{
    switch (state) {
    case STUSB4500_TYPEC_FSM_UNATTACHED_SNK: return "Unattached.SNK";
    case STUSB4500_TYPEC_FSM_ATTACH_WAIT_SNK: return "AttachWait.SNK";
    case STUSB4500_TYPEC_FSM_ATTACHED_SNK: return "Attached.SNK";
    case STUSB4500_TYPEC_FSM_DEBUG_ACCESSORY_SNK: return "DebugAccessory.SNK";
    default: return "Unknown";
    }
}

esp_err_t STUSB4500::checkAvailable() const
{
    if (nvm_unlocked_) {
        ESP_LOGE(TAG, "Register access refused while NVM is unlocked");
        return ESP_ERR_INVALID_STATE;
    }
    return ESP_OK;
}

esp_err_t STUSB4500::readRegister(uint8_t reg, uint8_t* value)
{
    esp_err_t ret = checkAvailable();
    if (ret != ESP_OK) return ret;

    return bus_.readRegister(reg, value);
}

esp_err_t STUSB4500::readWord(uint8_t reg, uint32_t* value)
{
    esp_err_t ret = checkAvailable();
    if (ret != ESP_OK) return ret;

    uint8_t regs[4];
    ret = bus_.read(reg, regs, 4);
    if (ret != ESP_OK) return ret;

    uint32_t word = 0;
    for (uint8_t i = 0; i < 4; i++) {
        word |= ((uint32_t)regs[i] << (i * 8));
    }

    *value = word;
    return ESP_OK;
}

esp_err_t STUSB4500::writeWord(uint8_t reg, uint32_t value)
{
    esp_err_t ret = checkAvailable();
    if (ret != ESP_OK) return ret;

    uint8_t regs[4];
    regs[0] = value & 0xFF;
    regs[1] = (value >> 8) & 0xFF;
    regs[2] = (value >> 16) & 0xFF;
    regs[3] = (value >> 24) & 0xFF;

    return bus_.write(reg, regs, 4);
}

uint8_t STUSB4500::pdoRegister(stusb4500_pdo_channel_t channel)
{
    switch (channel) {
    case STUSB4500_PDO_CHANNEL_1: return STUSB4500_REG_DPM_SNK_PDO1_0;
    case STUSB4500_PDO_CHANNEL_2: return STUSB4500_REG_DPM_SNK_PDO2_0;
    case STUSB4500_PDO_CHANNEL_3: return STUSB4500_REG_DPM_SNK_PDO3_0;
    default: return 0;
    }
}
