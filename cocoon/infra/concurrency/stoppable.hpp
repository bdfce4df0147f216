// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>

namespace cocoon {

//! \brief Components implementing stop-ability should derive from this
class Stoppable {
  public:
    //! \brief Sets a stop request for instance;
    //! \return True if the stop request has been triggered otherwise false (i.e. was already stopping)
    virtual bool stop() {
        bool expected{false};
        return stopping_.compare_exchange_strong(expected, true);
    }

    //! \brief Whether a stop request has been issued
    bool is_stopping() const { return stopping_.load(); }

    virtual ~Stoppable() = default;

  private:
    std::atomic_bool stopping_{false};
};

}  // namespace cocoon
