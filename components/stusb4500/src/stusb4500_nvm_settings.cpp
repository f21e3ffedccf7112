#include "stusb4500_nvm_settings.h"

#include "esp_log.h"

#include <string.h>

static const char* TAG = "stusb4500_nvm_settings";

uint32_t nvmCurrentCodeToMilliamps(uint8_t code)
{
    code &= 0x0F;
    if (code == 0) {
        return 0;
    }
    else if (code < 11) {
        return code * 250 + 250;
    }
    else {
        return code * 500 - 2500;
    }
}

esp_err_t nvmCurrentCodeFromMilliamps(uint32_t current_ma, uint8_t* code)
{
    if (code == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    if (current_ma == 0) {
        *code = 0;
    }
    else if (current_ma >= 500 && current_ma <= 2750 && current_ma % 250 == 0) {
        *code = (uint8_t)((current_ma - 250) / 250);
    }
    else if (current_ma >= 3000 && current_ma <= 5000 && current_ma % 500 == 0) {
        *code = (uint8_t)((current_ma + 2500) / 500);
    }
    else {
        return ESP_ERR_INVALID_ARG;
    }
    return ESP_OK;
}

esp_err_t nvmDecodeSettings(const uint8_t s[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE],
    NvmSettings* settings)
{
    if (s == nullptr || settings == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    memset(settings, 0, sizeof(*settings));

    settings->pdo_count = (s[3][2] & 0x06) >> 1;
    settings->usb_comm_capable = (s[3][2] & 0x01) != 0;
    settings->external_power = (s[3][2] & 0x08) != 0;

    NvmPdoSettings& pdo1 = settings->pdo[0];
    pdo1.voltage_mv = STUSB4500_NVM_PDO1_VOLTAGE_MV;
    pdo1.current_ma = nvmCurrentCodeToMilliamps((s[3][2] & 0xF0) >> 4);
    pdo1.lower_tolerance_pct = 0;
    pdo1.upper_tolerance_pct = (s[3][3] >> 4) + 5;

    NvmPdoSettings& pdo2 = settings->pdo[1];
    pdo2.voltage_mv = ((s[4][1] << 2) + (s[4][0] >> 6)) * STUSB4500_PDO_VOLTAGE_LSB_MV;
    pdo2.current_ma = nvmCurrentCodeToMilliamps(s[3][4] & 0x0F);
    pdo2.lower_tolerance_pct = (s[3][4] >> 4) + 5;
    pdo2.upper_tolerance_pct = (s[3][5] & 0x0F) + 5;

    NvmPdoSettings& pdo3 = settings->pdo[2];
    pdo3.voltage_mv = (((s[4][3] & 0x03) << 8) + s[4][2]) * STUSB4500_PDO_VOLTAGE_LSB_MV;
    pdo3.current_ma = nvmCurrentCodeToMilliamps((s[3][5] & 0xF0) >> 4);
    pdo3.lower_tolerance_pct = (s[3][6] & 0x0F) + 5;
    pdo3.upper_tolerance_pct = (s[3][6] >> 4) + 5;

    settings->flex_current_ma = (((s[4][4] & 0x0F) << 6) + ((s[4][3] & 0xFC) >> 2)) * STUSB4500_PDO_CURRENT_LSB_MA;
    settings->power_ok_cfg = (s[4][4] & 0x60) >> 5;
    settings->gpio_ctrl = (s[1][0] & 0x30) >> 4;
    settings->power_only_above_5v = (s[4][6] & 0x08) != 0;
    settings->req_src_current = (s[4][6] & 0x10) != 0;

    return ESP_OK;
}

static bool toleranceValid(uint8_t pct)
{
    return pct >= STUSB4500_NVM_TOLERANCE_MIN_PCT && pct <= STUSB4500_NVM_TOLERANCE_MAX_PCT;
}

static bool voltageValid(uint32_t voltage_mv)
{
    return voltage_mv >= STUSB4500_NVM_VOLTAGE_MIN_MV && voltage_mv <= STUSB4500_NVM_VOLTAGE_MAX_MV &&
        voltage_mv % STUSB4500_PDO_VOLTAGE_LSB_MV == 0;
}

esp_err_t nvmEncodeSettings(const NvmSettings& settings,
    uint8_t s[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE])
{
    if (s == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    const NvmPdoSettings& pdo1 = settings.pdo[0];
    const NvmPdoSettings& pdo2 = settings.pdo[1];
    const NvmPdoSettings& pdo3 = settings.pdo[2];

    if (settings.pdo_count < 1 || settings.pdo_count > STUSB4500_PDO_CHANNEL_COUNT) {
        ESP_LOGE(TAG, "Invalid PDO count %u", settings.pdo_count);
        return ESP_ERR_INVALID_ARG;
    }
    if (pdo1.voltage_mv != STUSB4500_NVM_PDO1_VOLTAGE_MV) {
        ESP_LOGE(TAG, "PDO1 voltage is fixed at 5V");
        return ESP_ERR_INVALID_ARG;
    }
    if (!voltageValid(pdo2.voltage_mv) || !voltageValid(pdo3.voltage_mv)) {
        ESP_LOGE(TAG, "PDO voltage out of range: %lu mV / %lu mV",
            (unsigned long)pdo2.voltage_mv, (unsigned long)pdo3.voltage_mv);
        return ESP_ERR_INVALID_ARG;
    }
    if (!toleranceValid(pdo1.upper_tolerance_pct) ||
        !toleranceValid(pdo2.lower_tolerance_pct) || !toleranceValid(pdo2.upper_tolerance_pct) ||
        !toleranceValid(pdo3.lower_tolerance_pct) || !toleranceValid(pdo3.upper_tolerance_pct)) {
        ESP_LOGE(TAG, "Voltage tolerance must be %d..%d%%",
            STUSB4500_NVM_TOLERANCE_MIN_PCT, STUSB4500_NVM_TOLERANCE_MAX_PCT);
        return ESP_ERR_INVALID_ARG;
    }
    if (settings.flex_current_ma > STUSB4500_NVM_FLEX_CURRENT_MAX_MA ||
        settings.flex_current_ma % STUSB4500_PDO_CURRENT_LSB_MA != 0) {
        ESP_LOGE(TAG, "Invalid flex current %lu mA", (unsigned long)settings.flex_current_ma);
        return ESP_ERR_INVALID_ARG;
    }
    if (settings.gpio_ctrl > 3 || settings.power_ok_cfg > 3) {
        return ESP_ERR_INVALID_ARG;
    }

    uint8_t current_codes[STUSB4500_PDO_CHANNEL_COUNT];
    for (int i = 0; i < STUSB4500_PDO_CHANNEL_COUNT; i++) {
        if (nvmCurrentCodeFromMilliamps(settings.pdo[i].current_ma, &current_codes[i]) != ESP_OK) {
            ESP_LOGE(TAG, "PDO%d current %lu mA has no NVM encoding", i + 1,
                (unsigned long)settings.pdo[i].current_ma);
            return ESP_ERR_INVALID_ARG;
        }
    }

    // Sector 1
    s[1][0] = (s[1][0] & 0xCF) | (settings.gpio_ctrl << 4);

    // Sector 3
    uint8_t s3b2 = current_codes[0] << 4;
    s3b2 |= settings.external_power ? 0x08 : 0x00;
    s3b2 |= settings.pdo_count << 1;
    s3b2 |= settings.usb_comm_capable ? 0x01 : 0x00;
    s[3][2] = s3b2;

    s[3][3] = (s[3][3] & 0x0F) | ((pdo1.upper_tolerance_pct - 5) << 4);
    s[3][4] = ((pdo2.lower_tolerance_pct - 5) << 4) | current_codes[1];
    s[3][5] = (current_codes[2] << 4) | (pdo2.upper_tolerance_pct - 5);
    s[3][6] = ((pdo3.upper_tolerance_pct - 5) << 4) | (pdo3.lower_tolerance_pct - 5);

    // Sector 4
    uint16_t voltage2 = pdo2.voltage_mv / STUSB4500_PDO_VOLTAGE_LSB_MV;
    uint16_t voltage3 = pdo3.voltage_mv / STUSB4500_PDO_VOLTAGE_LSB_MV;
    uint16_t flex = settings.flex_current_ma / STUSB4500_PDO_CURRENT_LSB_MA;

    s[4][0] = (s[4][0] & 0x3F) | ((voltage2 & 0x03) << 6);
    s[4][1] = voltage2 >> 2;
    s[4][2] = voltage3 & 0xFF;
    s[4][3] = ((flex << 2) & 0xFC) | ((voltage3 >> 8) & 0x03);
    s[4][4] = (s[4][4] & 0x90) | (settings.power_ok_cfg << 5) | ((flex >> 6) & 0x0F);
    s[4][6] = (s[4][6] & 0xE7) | (settings.req_src_current ? 0x10 : 0x00) |
        (settings.power_only_above_5v ? 0x08 : 0x00);

    return ESP_OK;
}
