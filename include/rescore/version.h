#pragma once

#define RESCORE_VERSION_MAJOR 0
#define RESCORE_VERSION_MINOR 3
#define RESCORE_VERSION_PATCH 1
#define RESCORE_VERSION "0.3.1"
