/**
 * @file subghz.hpp
 * @brief Main subghz library interface
 */
#pragma once

#include "config/system_config.hpp"
#include "hardware/bus_transport.hpp"
#include "hardware/hal_factory.hpp"
#include "hardware/radio_handle.hpp"
#include "radio/radio_driver.hpp"
#include "types/configurations/driver_configuration.hpp"
#include "types/configurations/radio_configuration.hpp"
#include "types/error_codes/result.hpp"
#include "utils/logger.hpp"
