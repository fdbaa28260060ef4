#pragma once

#include "logger.hpp"

namespace anybody::home
{
/**
 * @brief Returns the singleton Logger class
 *
 * @return Logger& - The logger
 */
Logger& getLogger();
} // namespace anybody::home
