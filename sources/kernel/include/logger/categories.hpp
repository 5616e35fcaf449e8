#pragma once

#include "logger/logger.hpp"

constinit inline kr::Logger InitLog { "INIT" };
constinit inline kr::Logger BootLog { "BOOT" };
constinit inline kr::Logger MemLog { "MEM" };
constinit inline kr::Logger IsrLog { "ISR" };
