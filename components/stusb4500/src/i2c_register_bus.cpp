#include "i2c_register_bus.h"

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <string.h>

static const char* TAG = "I2cRegisterBus";

I2cRegisterBus::I2cRegisterBus(const I2cRegisterBusConfig& config)
    : config_(config)
{
}

I2cRegisterBus::~I2cRegisterBus()
{
    deinitialize();
}

esp_err_t I2cRegisterBus::initialize()
{
    if (device_handle_ != nullptr) {
        ESP_LOGW(TAG, "I2C bus already initialized");
        return ESP_OK;
    }

    i2c_master_bus_config_t bus_config = {};
    bus_config.i2c_port = config_.port;
    bus_config.sda_io_num = config_.sda_pin;
    bus_config.scl_io_num = config_.scl_pin;
    bus_config.clk_source = I2C_CLK_SRC_DEFAULT;
    bus_config.glitch_ignore_cnt = 7;
    bus_config.intr_priority = 0;
    bus_config.flags.enable_internal_pullup = true;

    esp_err_t ret = i2c_new_master_bus(&bus_config, &bus_handle_);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to create I2C master bus: %s", esp_err_to_name(ret));
        bus_handle_ = nullptr;
        return ret;
    }

    i2c_device_config_t device_config = {};
    device_config.dev_addr_length = I2C_ADDR_BIT_LEN_7;
    device_config.device_address = config_.device_address;
    device_config.scl_speed_hz = config_.scl_speed_hz;

    ret = i2c_master_bus_add_device(bus_handle_, &device_config, &device_handle_);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to add device 0x%02X to I2C bus: %s",
            config_.device_address, esp_err_to_name(ret));
        i2c_del_master_bus(bus_handle_);
        bus_handle_ = nullptr;
        device_handle_ = nullptr;
        return ret;
    }

    ESP_LOGI(TAG, "I2C bus configured: port=%d, SDA=%d, SCL=%d, freq=%luHz, addr=0x%02X",
        (int)config_.port, (int)config_.sda_pin, (int)config_.scl_pin,
        (unsigned long)config_.scl_speed_hz, config_.device_address);

    return ESP_OK;
}

void I2cRegisterBus::deinitialize()
{
    if (device_handle_ != nullptr) {
        esp_err_t ret = i2c_master_bus_rm_device(device_handle_);
        if (ret != ESP_OK) {
            ESP_LOGW(TAG, "Failed to remove I2C device: %s", esp_err_to_name(ret));
        }
        device_handle_ = nullptr;
    }

    if (bus_handle_ != nullptr) {
        esp_err_t ret = i2c_del_master_bus(bus_handle_);
        if (ret != ESP_OK) {
            ESP_LOGW(TAG, "Failed to delete I2C bus: %s", esp_err_to_name(ret));
        }
        bus_handle_ = nullptr;
    }
}

esp_err_t I2cRegisterBus::write(uint8_t reg, const uint8_t* data, size_t len)
{
    if (device_handle_ == nullptr) {
        ESP_LOGE(TAG, "I2C write failed: bus not initialized");
        return ESP_ERR_INVALID_STATE;
    }
    if (data == nullptr || len == 0) {
        return ESP_ERR_INVALID_ARG;
    }
    if (len > MAX_WRITE_LEN) {
        return ESP_ERR_INVALID_SIZE;
    }

    uint8_t write_buffer[MAX_WRITE_LEN + 1];
    write_buffer[0] = reg;
    memcpy(&write_buffer[1], data, len);

    ESP_LOGD(TAG, "I2C write: reg=0x%02X, len=%u, data=0x%02X", reg, (unsigned)len, data[0]);

    esp_err_t ret = i2c_master_transmit(device_handle_, write_buffer, len + 1, config_.timeout_ms);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "I2C write failed: reg=0x%02X, error=%s", reg, esp_err_to_name(ret));
    }

    return ret;
}

esp_err_t I2cRegisterBus::read(uint8_t reg, uint8_t* data, size_t len)
{
    if (device_handle_ == nullptr) {
        ESP_LOGE(TAG, "I2C read failed: bus not initialized");
        return ESP_ERR_INVALID_STATE;
    }
    if (data == nullptr || len == 0) {
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t ret = i2c_master_transmit_receive(device_handle_, &reg, 1, data, len, config_.timeout_ms);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "I2C read failed: reg=0x%02X, error=%s", reg, esp_err_to_name(ret));
    }
    else {
        ESP_LOGD(TAG, "I2C read: reg=0x%02X, len=%u, data=0x%02X", reg, (unsigned)len, data[0]);
    }

    return ret;
}

void I2cRegisterBus::delayMs(uint32_t ms)
{
    vTaskDelay(pdMS_TO_TICKS(ms));
}
