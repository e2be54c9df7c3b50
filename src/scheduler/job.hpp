/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

namespace kairos {

  /// Unit of work which is run each time its schedule fires
  class Job {
   public:
    virtual ~Job() = default;

    virtual void run() = 0;
  };

  /// Adapts a plain function to Job
  class FuncJob final : public Job {
   public:
    explicit FuncJob(std::function<void()> func) : func_(std::move(func)) {}

    void run() override {
      func_();
    }

   private:
    std::function<void()> func_;
  };

}  // namespace kairos
