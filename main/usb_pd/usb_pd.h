#pragma once

#include "esp_err.h"
#include "stusb4500.h"

#include <stddef.h>
#include <stdint.h>

typedef struct {
    uint32_t voltage_mv;
    uint32_t current_ma;
} usb_pd_sink_pdo_t;

// Sink capabilities kept in NVM
typedef struct {
    uint8_t pdo_count;
    usb_pd_sink_pdo_t pdo[STUSB4500_PDO_CHANNEL_COUNT];
    bool usb_comm_capable;
    bool external_power;
} usb_pd_profile_t;

// 5V/3A, 15V/3A, 20V/5A
usb_pd_profile_t usb_pd_default_profile();

// Probe the chip and make sure its NVM holds the default profile
esp_err_t usb_pd_init(STUSB4500& device);

esp_err_t usb_pd_dump_nvm(STUSB4500& device, uint8_t blob[STUSB4500_NVM_IMAGE_SIZE]);
esp_err_t usb_pd_restore_nvm(STUSB4500& device, const uint8_t* blob, size_t len);
esp_err_t usb_pd_factory_reset(STUSB4500& device);

// Rewrites NVM only when the stored sink profile differs, then soft-resets
// the chip so the new capabilities are renegotiated
esp_err_t usb_pd_apply_profile(STUSB4500& device, const usb_pd_profile_t& profile, bool* changed);

esp_err_t usb_pd_log_status(STUSB4500& device);
