// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/publish_transport.hpp"

namespace pubbatch {

const char* to_string(SendStatus status) {
    switch (status) {
        case SendStatus::Ok: return "ok";
        case SendStatus::Retryable: return "retryable";
        case SendStatus::Fatal: return "fatal";
    }
    return "unknown";
}

}  // namespace pubbatch
