#include "TestUtil.h"
#include "stusb4500.h"
#include "stusb4500_nvm_settings.h"
#include "usb_pd.h"

#include <string.h>
#include <unity.h>

static SimulatedBus* bus;
static STUSB4500* device;

static void readSimulatedSettings(NvmSettings* settings)
{
    uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE];
    for (uint8_t i = 0; i < STUSB4500_NVM_SECTOR_COUNT; i++) {
        memcpy(sectors[i], bus->nvmSector(i), STUSB4500_NVM_SECTOR_SIZE);
    }
    TEST_ASSERT_EQUAL(ESP_OK, nvmDecodeSettings(sectors, settings));
}

void setUp(void)
{
    bus = new SimulatedBus();
    bus->setNvm(NvmSession::factory_defaults);
    device = new STUSB4500(*bus);
}

void tearDown(void)
{
    delete device;
    delete bus;
}

void test_default_profile(void)
{
    usb_pd_profile_t profile = usb_pd_default_profile();
    TEST_ASSERT_EQUAL_UINT8(3, profile.pdo_count);
    TEST_ASSERT_EQUAL_UINT32(5000, profile.pdo[0].voltage_mv);
    TEST_ASSERT_EQUAL_UINT32(3000, profile.pdo[0].current_ma);
    TEST_ASSERT_EQUAL_UINT32(15000, profile.pdo[1].voltage_mv);
    TEST_ASSERT_EQUAL_UINT32(3000, profile.pdo[1].current_ma);
    TEST_ASSERT_EQUAL_UINT32(20000, profile.pdo[2].voltage_mv);
    TEST_ASSERT_EQUAL_UINT32(5000, profile.pdo[2].current_ma);
    TEST_ASSERT_TRUE(profile.usb_comm_capable);
    TEST_ASSERT_TRUE(profile.external_power);
}

void test_apply_profile_rewrites_differing_nvm(void)
{
    bool changed = false;
    TEST_ASSERT_EQUAL(ESP_OK, usb_pd_apply_profile(*device, usb_pd_default_profile(), &changed));
    TEST_ASSERT_TRUE(changed);
    TEST_ASSERT_FALSE(device->isNvmUnlocked());
    TEST_ASSERT_EQUAL_UINT32(STUSB4500_NVM_SECTOR_COUNT, bus->nvmWriteCount());

    NvmSettings settings;
    readSimulatedSettings(&settings);
    TEST_ASSERT_EQUAL_UINT8(3, settings.pdo_count);
    TEST_ASSERT_TRUE(settings.usb_comm_capable);
    TEST_ASSERT_TRUE(settings.external_power);
    TEST_ASSERT_EQUAL_UINT32(3000, settings.pdo[0].current_ma);
    TEST_ASSERT_EQUAL_UINT32(15000, settings.pdo[1].voltage_mv);
    TEST_ASSERT_EQUAL_UINT32(3000, settings.pdo[1].current_ma);
    TEST_ASSERT_EQUAL_UINT32(20000, settings.pdo[2].voltage_mv);
    TEST_ASSERT_EQUAL_UINT32(5000, settings.pdo[2].current_ma);
    // Tolerances from the previous image are carried over
    TEST_ASSERT_EQUAL_UINT8(20, settings.pdo[1].lower_tolerance_pct);

    // Renegotiation is requested after the lock
    size_t n = bus->writes().size();
    assertSingleWrite(*bus, n - 2, STUSB4500_REG_TX_HEADER_LOW, 0x0D);
    assertSingleWrite(*bus, n - 1, STUSB4500_REG_PD_COMMAND_CTRL, 0x26);
    assertSingleWrite(*bus, n - 3, STUSB4500_REG_FTP_CUST_PASSWORD_REG, 0x00);
}

void test_apply_profile_skips_matching_nvm(void)
{
    bool changed = false;
    TEST_ASSERT_EQUAL(ESP_OK, usb_pd_apply_profile(*device, usb_pd_default_profile(), &changed));
    TEST_ASSERT_TRUE(changed);

    bus->clearLog();
    TEST_ASSERT_EQUAL(ESP_OK, usb_pd_apply_profile(*device, usb_pd_default_profile(), &changed));
    TEST_ASSERT_FALSE(changed);
    TEST_ASSERT_EQUAL_UINT32(STUSB4500_NVM_SECTOR_COUNT, bus->nvmWriteCount());

    for (size_t i = 0; i < bus->writes().size(); i++) {
        TEST_ASSERT_NOT_EQUAL(STUSB4500_REG_PD_COMMAND_CTRL, bus->writes()[i].reg);
    }
    TEST_ASSERT_FALSE(device->isNvmUnlocked());
}

void test_apply_profile_rejects_unencodable_profile(void)
{
    usb_pd_profile_t profile = usb_pd_default_profile();
    profile.pdo[1].current_ma = 1100;

    bool changed = true;
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, usb_pd_apply_profile(*device, profile, &changed));
    TEST_ASSERT_FALSE(changed);
    TEST_ASSERT_FALSE(device->isNvmUnlocked());
    TEST_ASSERT_EQUAL_UINT32(0, bus->nvmWriteCount());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(NvmSession::factory_defaults[3], bus->nvmSector(3), STUSB4500_NVM_SECTOR_SIZE);
}

void test_apply_profile_reports_request_timeout(void)
{
    bus->holdRequest(true);

    bool changed = true;
    TEST_ASSERT_EQUAL(ESP_ERR_TIMEOUT, usb_pd_apply_profile(*device, usb_pd_default_profile(), &changed));
    TEST_ASSERT_FALSE(changed);
    TEST_ASSERT_FALSE(device->isNvmUnlocked());
}

void test_dump_nvm(void)
{
    uint8_t blob[STUSB4500_NVM_IMAGE_SIZE];
    memset(blob, 0, sizeof(blob));

    TEST_ASSERT_EQUAL(ESP_OK, usb_pd_dump_nvm(*device, blob));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(NvmSession::factory_defaults, blob, STUSB4500_NVM_IMAGE_SIZE);
    TEST_ASSERT_FALSE(device->isNvmUnlocked());
}

void test_restore_nvm(void)
{
    uint8_t blob[STUSB4500_NVM_IMAGE_SIZE];
    for (int i = 0; i < STUSB4500_NVM_IMAGE_SIZE; i++) {
        blob[i] = (uint8_t)(0xA0 + i);
    }

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_SIZE, usb_pd_restore_nvm(*device, blob, 39));
    TEST_ASSERT_EQUAL_UINT32(0, bus->writes().size());

    TEST_ASSERT_EQUAL(ESP_OK, usb_pd_restore_nvm(*device, blob, sizeof(blob)));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(&blob[8 * 4], bus->nvmSector(4), STUSB4500_NVM_SECTOR_SIZE);
    TEST_ASSERT_FALSE(device->isNvmUnlocked());

    uint8_t dumped[STUSB4500_NVM_IMAGE_SIZE];
    TEST_ASSERT_EQUAL(ESP_OK, usb_pd_dump_nvm(*device, dumped));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(blob, dumped, STUSB4500_NVM_IMAGE_SIZE);
}

void test_factory_reset(void)
{
    uint8_t blob[STUSB4500_NVM_IMAGE_SIZE];
    memset(blob, 0x11, sizeof(blob));
    TEST_ASSERT_EQUAL(ESP_OK, usb_pd_restore_nvm(*device, blob, sizeof(blob)));

    TEST_ASSERT_EQUAL(ESP_OK, usb_pd_factory_reset(*device));
    for (uint8_t i = 0; i < STUSB4500_NVM_SECTOR_COUNT; i++) {
        TEST_ASSERT_EQUAL_HEX8_ARRAY(NvmSession::factory_defaults[i], bus->nvmSector(i), STUSB4500_NVM_SECTOR_SIZE);
    }
}

void test_init_rejects_missing_chip(void)
{
    bus->setRegister(STUSB4500_REG_DEVICE_ID, 0x42);
    TEST_ASSERT_EQUAL(ESP_ERR_NOT_FOUND, usb_pd_init(*device));
    TEST_ASSERT_EQUAL_UINT32(0, bus->nvmWriteCount());
}

void test_init_provisions_default_profile(void)
{
    TEST_ASSERT_EQUAL(ESP_OK, usb_pd_init(*device));

    NvmSettings settings;
    readSimulatedSettings(&settings);
    TEST_ASSERT_EQUAL_UINT32(20000, settings.pdo[2].voltage_mv);
    TEST_ASSERT_EQUAL_UINT32(5000, settings.pdo[2].current_ma);
}

void test_log_status(void)
{
    bus->setWord(STUSB4500_REG_DPM_SNK_PDO1_0, Pdo::fixed(100, 300).bits());
    bus->setWord(STUSB4500_REG_DPM_SNK_PDO2_0, 0x4A0320C8);
    bus->setWord(STUSB4500_REG_RDO_REG_STATUS, (1u << 28) | (300u << 10) | 300u);
    TEST_ASSERT_EQUAL(ESP_OK, usb_pd_log_status(*device));

    NvmSession session;
    TEST_ASSERT_EQUAL(ESP_OK, device->unlockNvm(&session));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, usb_pd_log_status(*device));
}

int main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_default_profile);
    RUN_TEST(test_apply_profile_rewrites_differing_nvm);
    RUN_TEST(test_apply_profile_skips_matching_nvm);
    RUN_TEST(test_apply_profile_rejects_unencodable_profile);
    RUN_TEST(test_apply_profile_reports_request_timeout);
    RUN_TEST(test_dump_nvm);
    RUN_TEST(test_restore_nvm);
    RUN_TEST(test_factory_reset);
    RUN_TEST(test_init_rejects_missing_chip);
    RUN_TEST(test_init_provisions_default_profile);
    RUN_TEST(test_log_status);
    return UNITY_END();
}
