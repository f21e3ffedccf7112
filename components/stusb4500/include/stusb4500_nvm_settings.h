#pragma once

#include "esp_err.h"
#include "stusb4500_types.h"

#include <stdint.h>

// Valid tolerance percentages for the VBUS monitoring windows
#define STUSB4500_NVM_TOLERANCE_MIN_PCT         5
#define STUSB4500_NVM_TOLERANCE_MAX_PCT         20

#define STUSB4500_NVM_PDO1_VOLTAGE_MV           5000
#define STUSB4500_NVM_VOLTAGE_MIN_MV            5000
#define STUSB4500_NVM_VOLTAGE_MAX_MV            20000
#define STUSB4500_NVM_FLEX_CURRENT_MAX_MA       5000

struct NvmPdoSettings {
    uint32_t voltage_mv;            // PDO1 is always 5000
    uint32_t current_ma;            // 0 selects the flex current
    uint8_t lower_tolerance_pct;    // unused for PDO1
    uint8_t upper_tolerance_pct;
};

// Sink configuration fields of the 40-byte NVM image
struct NvmSettings {
    uint8_t pdo_count;              // 1..3
    NvmPdoSettings pdo[STUSB4500_PDO_CHANNEL_COUNT];
    uint32_t flex_current_ma;
    bool usb_comm_capable;
    bool external_power;
    bool power_only_above_5v;
    bool req_src_current;
    uint8_t gpio_ctrl;              // 0: SW_CTRL_GPIO, 1: ERROR_RECOVERY, 2: DEBUG, 3: SINK_POWER
    uint8_t power_ok_cfg;           // 0..3, POWER_OK pin configuration
};

esp_err_t nvmDecodeSettings(const uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE],
    NvmSettings* settings);

// Updates only the settings bits; everything else in the image is preserved
esp_err_t nvmEncodeSettings(const NvmSettings& settings,
    uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE]);

// Vendor 4-bit current code <-> milliamps
uint32_t nvmCurrentCodeToMilliamps(uint8_t code);
esp_err_t nvmCurrentCodeFromMilliamps(uint32_t current_ma, uint8_t* code);
