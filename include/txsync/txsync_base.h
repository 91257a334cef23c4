/*
 * The core imports for txsync. Use this to ensure the correct import order can be maintained.
 */

#ifndef TXSYNC_BASE_H
#define TXSYNC_BASE_H

#include <fmt/format.h>
#include <fmt/chrono.h>
#include <fmt/ranges.h>

#include <txsync/txsync_export.h>
#include <txsync/txsync_forward_declarations.h>
#include <txsync/util/date_time.h>
#include <txsync/util/errors.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#endif  // TXSYNC_BASE_H
