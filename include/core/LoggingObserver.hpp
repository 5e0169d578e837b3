#pragma once
/** @file  LoggingObserver.hpp
 *  @brief ProgressObserver that writes progress into the run log.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>

// AmpPoll headers
#include "core/Logger.hpp"
#include "core/ProgressObserver.hpp"

namespace amppoll::core {

  class LoggingObserver : public ProgressObserver {
  public:
    explicit LoggingObserver(std::shared_ptr<Logger> logger);

    void onStep(const ProgressEvent& event) override;
    void onDeviceFinished(const DeviceSummary& summary) override;

  private:
    std::shared_ptr<Logger> logger_;
  };

} // namespace amppoll::core
