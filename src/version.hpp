#pragma once

// Build/version info.
//
// CMake defines CRYPTCRAWL_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef CRYPTCRAWL_VERSION
#define CRYPTCRAWL_VERSION "dev"
#endif

#ifndef CRYPTCRAWL_APPNAME
#define CRYPTCRAWL_APPNAME "CryptCrawl"
#endif
