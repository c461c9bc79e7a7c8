// src/config/system_config.hpp
#pragma once

#if defined(ARDUINO) && ARDUINO >= 100
// Arduino implementations
#include <Arduino.h>

#define SUBGHZ_BUILD_ARDUINO
#else
// Native implementation
#include <stdio.h>
#define SUBGHZ_BUILD_NATIVE
#endif

#ifndef SUBGHZ_LOG_LEVEL
#define SUBGHZ_LOG_LEVEL 0  // 0=DEBUG, 1=INFO, 2=WARNING, 3=ERROR, 4=NO_LOG
#endif
//#define LOGGER_DISABLE_COLORS   // Disable color output
#define LOGGER_BUFFER_SIZE 128  // Adjust buffer size for your needs
