#include "stusb4500_pdo.h"
#include "stusb4500_rdo.h"

#include <unity.h>

void setUp(void) {}

void tearDown(void) {}

void test_from_bits_preserves_word_for_every_tag(void)
{
    const uint32_t words[] = { 0x0001912C, 0x4A0320C8, 0x8B4190FF, 0xC8DC1432, 0x00000000, 0xFFFFFFFF };

    for (uint32_t word : words) {
        Pdo pdo = Pdo::fromBits(word);
        TEST_ASSERT_EQUAL_HEX32(word, pdo.bits());
        TEST_ASSERT_EQUAL((int)(word >> 30), (int)pdo.type());
    }
}

void test_fixed_places_fields_and_truncates(void)
{
    Pdo pdo = Pdo::fixed(100, 300);
    TEST_ASSERT_EQUAL(PdoType::Fixed, pdo.type());
    TEST_ASSERT_EQUAL_HEX32((100u << 10) | 300u, pdo.bits());

    FixedPdo fixed;
    TEST_ASSERT_EQUAL(ESP_OK, pdo.asFixed(&fixed));
    TEST_ASSERT_EQUAL_UINT16(100, fixed.voltage());
    TEST_ASSERT_EQUAL_UINT16(300, fixed.current());
    TEST_ASSERT_FALSE(fixed.dualRolePower());
    TEST_ASSERT_FALSE(fixed.higherCapability());
    TEST_ASSERT_FALSE(fixed.unconstrainedPower());
    TEST_ASSERT_FALSE(fixed.usbCommunicationsCapable());
    TEST_ASSERT_FALSE(fixed.dualRoleData());
    TEST_ASSERT_EQUAL(FastSwapSupport::NotSupported, fixed.fastRoleSwap());

    // Only the low 10 bits of each field are kept
    Pdo truncated = Pdo::fixed(0x4FF, 0x7FF);
    TEST_ASSERT_EQUAL_HEX32((0x0FFu << 10) | 0x3FFu, truncated.bits());
}

void test_fixed_from_units(void)
{
    Pdo pdo;
    TEST_ASSERT_EQUAL(ESP_OK, Pdo::fixedFromUnits(15000, 3000, &pdo));
    TEST_ASSERT_EQUAL_HEX32(Pdo::fixed(300, 300).bits(), pdo.bits());

    // Rounded to the nearest LSB
    TEST_ASSERT_EQUAL(ESP_OK, Pdo::fixedFromUnits(5024, 1504, &pdo));
    TEST_ASSERT_EQUAL_HEX32(Pdo::fixed(100, 150).bits(), pdo.bits());

    Pdo unchanged = Pdo::fixed(1, 1);
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, Pdo::fixedFromUnits(60000, 1000, &unchanged));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, Pdo::fixedFromUnits(5000, 20000, &unchanged));
    TEST_ASSERT_EQUAL_HEX32(Pdo::fixed(1, 1).bits(), unchanged.bits());
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, Pdo::fixedFromUnits(5000, 1000, nullptr));
}

void test_fixed_flag_bits(void)
{
    Pdo pdo = Pdo::fixed(100, 300);
    uint32_t base = pdo.bits();

    TEST_ASSERT_EQUAL(ESP_OK, pdo.setDualRolePower(true));
    TEST_ASSERT_EQUAL_HEX32(base | (1u << 29), pdo.bits());
    TEST_ASSERT_EQUAL(ESP_OK, pdo.setHigherCapability(true));
    TEST_ASSERT_EQUAL(ESP_OK, pdo.setUnconstrainedPower(true));
    TEST_ASSERT_EQUAL(ESP_OK, pdo.setUsbCommunicationsCapable(true));
    TEST_ASSERT_EQUAL(ESP_OK, pdo.setDualRoleData(true));
    TEST_ASSERT_EQUAL_HEX32(base | 0x3E000000u, pdo.bits());

    TEST_ASSERT_EQUAL(ESP_OK, pdo.setDualRolePower(false));
    TEST_ASSERT_EQUAL(ESP_OK, pdo.setDualRoleData(false));
    TEST_ASSERT_EQUAL_HEX32(base | 0x1C000000u, pdo.bits());
    TEST_ASSERT_EQUAL(PdoType::Fixed, pdo.type());
}

void test_fixed_only_mutators_reject_other_types(void)
{
    const uint32_t words[] = { 0x4A0320C8, 0x8B4190FF, 0xC8DC1432 };

    for (uint32_t word : words) {
        Pdo pdo = Pdo::fromBits(word);
        TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, pdo.setDualRolePower(true));
        TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, pdo.setDualRoleData(true));
        TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, pdo.setUsbCommunicationsCapable(false));
        TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, pdo.setHigherCapability(true));
        TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, pdo.setUnconstrainedPower(false));
        TEST_ASSERT_EQUAL_HEX32(word, pdo.bits());
    }
}

void test_variant_accessors_check_tag(void)
{
    Pdo variable_pdo = Pdo::fromBits(0x4A0320C8);
    FixedPdo fixed;
    VariablePdo variable;
    BatteryPdo battery;
    AugmentedPdo augmented;

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, variable_pdo.asFixed(&fixed));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, variable_pdo.asBattery(&battery));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, variable_pdo.asAugmented(&augmented));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, variable_pdo.asVariable(nullptr));

    TEST_ASSERT_EQUAL(ESP_OK, variable_pdo.asVariable(&variable));
    TEST_ASSERT_EQUAL_UINT16(0x0A0, variable.maxVoltage());
    TEST_ASSERT_EQUAL_UINT16(0x0C8, variable.minVoltage());
    TEST_ASSERT_EQUAL_UINT16(0x0C8, variable.current());
}

void test_variable_and_battery_layouts(void)
{
    VariablePdo variable;
    variable.setMaxVoltage(400);
    variable.setMinVoltage(100);
    variable.setCurrent(300);
    TEST_ASSERT_EQUAL_HEX32(0x40000000u | (400u << 20) | (100u << 10) | 300u, variable.bits());
    TEST_ASSERT_EQUAL(PdoType::Variable, Pdo::fromBits(variable.bits()).type());

    BatteryPdo battery;
    battery.setMaxVoltage(400);
    battery.setMinVoltage(100);
    battery.setPower(240);
    TEST_ASSERT_EQUAL_HEX32(0x80000000u | (400u << 20) | (100u << 10) | 240u, battery.bits());
    TEST_ASSERT_EQUAL_UINT16(240, battery.power());
}

void test_augmented_layout(void)
{
    AugmentedPdo augmented;
    augmented.setMaxVoltage(210);
    augmented.setMinVoltage(33);
    augmented.setMaxCurrent(60);

    TEST_ASSERT_EQUAL_HEX32(0xC0000000u | (210u << 17) | (33u << 8) | 60u, augmented.bits());
    TEST_ASSERT_EQUAL_UINT8(0, augmented.programmableDevice());
    TEST_ASSERT_EQUAL_UINT16(210, augmented.maxVoltage());
    TEST_ASSERT_EQUAL_UINT16(33, augmented.minVoltage());
    TEST_ASSERT_EQUAL_UINT16(60, augmented.maxCurrent());

    // Fields do not bleed into each other
    augmented.setMaxCurrent(0xFF);
    TEST_ASSERT_EQUAL_UINT16(0x7F, augmented.maxCurrent());
    TEST_ASSERT_EQUAL_UINT16(33, augmented.minVoltage());
}

void test_fast_swap_round_trip(void)
{
    const FastSwapSupport values[] = {
        FastSwapSupport::NotSupported,
        FastSwapSupport::DefaultUsb,
        FastSwapSupport::Current1A5,
        FastSwapSupport::Current3A0,
    };

    for (FastSwapSupport value : values) {
        TEST_ASSERT_EQUAL(value, fastSwapFromBits(fastSwapToBits(value)));

        FixedPdo fixed;
        fixed.setFastRoleSwap(value);
        TEST_ASSERT_EQUAL(value, fixed.fastRoleSwap());
        TEST_ASSERT_EQUAL_HEX32(fastSwapToBits(value) << 23, fixed.bits());
    }

    TEST_ASSERT_EQUAL_STRING("1.5A @ 5V", fastSwapToString(FastSwapSupport::Current1A5));
}

void test_rdo_fields(void)
{
    uint32_t word = (2u << 28) | (1u << 26) | (1u << 24) | (250u << 10) | 300u;
    Rdo rdo(word);

    TEST_ASSERT_EQUAL_UINT8(2, rdo.position());
    TEST_ASSERT_FALSE(rdo.giveBack());
    TEST_ASSERT_TRUE(rdo.capabilityMismatch());
    TEST_ASSERT_FALSE(rdo.usbCommunicationCapable());
    TEST_ASSERT_TRUE(rdo.noUsbSuspend());
    TEST_ASSERT_FALSE(rdo.unchunkedExtendedMessages());
    TEST_ASSERT_EQUAL_UINT16(250, rdo.operatingCurrent());
    TEST_ASSERT_EQUAL_UINT16(300, rdo.maxOperatingCurrent());
    TEST_ASSERT_EQUAL_HEX32(word, rdo.bits());

    TEST_ASSERT_EQUAL_UINT8(0, Rdo().position());
}

int main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_from_bits_preserves_word_for_every_tag);
    RUN_TEST(test_fixed_places_fields_and_truncates);
    RUN_TEST(test_fixed_from_units);
    RUN_TEST(test_fixed_flag_bits);
    RUN_TEST(test_fixed_only_mutators_reject_other_types);
    RUN_TEST(test_variant_accessors_check_tag);
    RUN_TEST(test_variable_and_battery_layouts);
    RUN_TEST(test_augmented_layout);
    RUN_TEST(test_fast_swap_round_trip);
    RUN_TEST(test_rdo_fields);
    return UNITY_END();
}
