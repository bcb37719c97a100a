#pragma once

// Single source of truth for the relay version.
// Reported by GET /health and in the startup banner.
#define BLACKROOM_VERSION_STRING "0.1.0"
