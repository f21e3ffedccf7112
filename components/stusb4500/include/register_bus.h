#pragma once

#include "esp_err.h"

#include <stddef.h>
#include <stdint.h>

// Blocking byte-oriented access to an 8-bit register map.
class RegisterBus {
public:
    virtual ~RegisterBus() = default;

    // Writes len bytes starting at reg (register address followed by data in one transfer)
    virtual esp_err_t write(uint8_t reg, const uint8_t* data, size_t len) = 0;
    // Sends reg, then reads len bytes back
    virtual esp_err_t read(uint8_t reg, uint8_t* data, size_t len) = 0;
    virtual void delayMs(uint32_t ms) = 0;

    esp_err_t writeRegister(uint8_t reg, uint8_t value) { return write(reg, &value, 1); }
    esp_err_t readRegister(uint8_t reg, uint8_t* value) { return read(reg, value, 1); }
};
