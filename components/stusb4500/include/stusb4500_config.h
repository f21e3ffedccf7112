#pragma once

// Defaults for the CONFIG_STUSB4500_* options declared in Kconfig. Builds
// outside the IDF configuration step pass them on the compiler command line.

#ifndef CONFIG_STUSB4500_I2C_PORT
#define CONFIG_STUSB4500_I2C_PORT               0
#endif

#ifndef CONFIG_STUSB4500_SDA_PIN
#define CONFIG_STUSB4500_SDA_PIN                8
#endif

#ifndef CONFIG_STUSB4500_SCL_PIN
#define CONFIG_STUSB4500_SCL_PIN                9
#endif

#ifndef CONFIG_STUSB4500_I2C_FREQ_HZ
#define CONFIG_STUSB4500_I2C_FREQ_HZ            400000
#endif

#ifndef CONFIG_STUSB4500_I2C_TIMEOUT_MS
#define CONFIG_STUSB4500_I2C_TIMEOUT_MS         100
#endif

#ifndef CONFIG_STUSB4500_I2C_ADDRESS
#define CONFIG_STUSB4500_I2C_ADDRESS            0x28
#endif

// Upper bound on FTP_CTRL_0 reads while waiting for the Request bit to clear
#ifndef CONFIG_STUSB4500_NVM_POLL_ATTEMPTS
#define CONFIG_STUSB4500_NVM_POLL_ATTEMPTS      100
#endif

#ifndef CONFIG_STUSB4500_NVM_POLL_INTERVAL_MS
#define CONFIG_STUSB4500_NVM_POLL_INTERVAL_MS   5
#endif
