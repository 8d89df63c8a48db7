#pragma once

#define PSR_VERSION_MAJOR 0
#define PSR_VERSION_MINOR 4
#define PSR_VERSION_PATCH 0
#define PSR_VERSION "0.4.0"
