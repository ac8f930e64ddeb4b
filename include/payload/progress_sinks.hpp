#pragma once

#include "payload/progress.hpp"

namespace otadump {

// Single self-overwriting status line on stderr.
class ConsoleProgressSink final : public IProgress {
  public:
    void OnProgress(const ProgressEvent& e) override;

  private:
    bool finished_ = false;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace otadump
