// Copyright (c) 2025 <Your Name>
#pragma once

#if defined(__GNUC__) && defined(DRIFT_SERVER_SHARED)
#define DRIFT_SERVER_API __attribute__((visibility("default")))
#else
#define DRIFT_SERVER_API
#endif
