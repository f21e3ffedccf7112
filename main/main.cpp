#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "esp_log.h"

#include "i2c_register_bus.h"
#include "stusb4500.h"
#include "usb_pd.h"

static const char* TAG = "main";

extern "C" void app_main(void)
{
    static I2cRegisterBus bus;
    static STUSB4500 stusb(bus);

    esp_err_t ret = bus.initialize();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "I2C init failed: %s", esp_err_to_name(ret));
        return;
    }

    // Keeps running at 5V if provisioning fails
    ret = usb_pd_init(stusb);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "USB-PD provisioning failed: %s", esp_err_to_name(ret));
        return;
    }

    // Give the source time to renegotiate after a soft reset
    vTaskDelay(pdMS_TO_TICKS(500));

    ret = usb_pd_log_status(stusb);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Failed to read USB-PD status: %s", esp_err_to_name(ret));
    }
}
