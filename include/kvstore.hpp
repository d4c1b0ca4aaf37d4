#pragma once

// Main header that includes everything
#include "kvstore/types.hpp"
#include "kvstore/exceptions.hpp"
#include "kvstore/transaction_logger.hpp"
#include "kvstore/store.hpp"
