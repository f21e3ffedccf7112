#pragma once

#include "register_bus.h"
#include "stusb4500_config.h"

#include "driver/i2c_master.h"
#include "driver/gpio.h"

struct I2cRegisterBusConfig {
    i2c_port_num_t port = CONFIG_STUSB4500_I2C_PORT;
    gpio_num_t sda_pin = (gpio_num_t)CONFIG_STUSB4500_SDA_PIN;
    gpio_num_t scl_pin = (gpio_num_t)CONFIG_STUSB4500_SCL_PIN;
    uint32_t scl_speed_hz = CONFIG_STUSB4500_I2C_FREQ_HZ;
    int timeout_ms = CONFIG_STUSB4500_I2C_TIMEOUT_MS;
    uint16_t device_address = CONFIG_STUSB4500_I2C_ADDRESS;
};

// RegisterBus over the ESP-IDF i2c_master driver. Owns the bus and device handles.
class I2cRegisterBus : public RegisterBus {
public:
    explicit I2cRegisterBus(const I2cRegisterBusConfig& config = I2cRegisterBusConfig());
    ~I2cRegisterBus() override;

    I2cRegisterBus(const I2cRegisterBus&) = delete;
    I2cRegisterBus& operator=(const I2cRegisterBus&) = delete;

    esp_err_t initialize();
    void deinitialize();
    bool isInitialized() const { return device_handle_ != nullptr; }

    esp_err_t write(uint8_t reg, const uint8_t* data, size_t len) override;
    esp_err_t read(uint8_t reg, uint8_t* data, size_t len) override;
    void delayMs(uint32_t ms) override;

private:
    // Register byte plus the largest burst the driver issues (one NVM sector)
    static constexpr size_t MAX_WRITE_LEN = 16;

    I2cRegisterBusConfig config_;
    i2c_master_bus_handle_t bus_handle_ = nullptr;
    i2c_master_dev_handle_t device_handle_ = nullptr;
};
