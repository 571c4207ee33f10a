/*

config.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Compile-time switches. Builds without exception support define XOAUTHXX_NO_EXCEPTIONS; every API still reports
through `result`, only `throwing.hpp` becomes unavailable.

*/

#pragma once

#define XOAUTHXX_VERSION_MAJOR 1
#define XOAUTHXX_VERSION_MINOR 0
#define XOAUTHXX_VERSION_PATCH 0

#if defined(XOAUTHXX_NO_EXCEPTIONS) || !defined(__cpp_exceptions)
#define XOAUTHXX_THROWING_ENABLED 0
#else
#define XOAUTHXX_THROWING_ENABLED 1
#endif
