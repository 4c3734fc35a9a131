#pragma once

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/report/style.hpp"
#include "progress_channel.hpp"

namespace prepush::scheduler {

struct LaneDisplay {
  std::string name;
  std::string color;
  std::size_t total = 0;
  std::size_t done  = 0;
};

/*
  Single consumer of the progress channel.

  Owns every piece of display state, so lane workers never touch the output
  stream. Writes one line per event.
*/
class ProgressRenderer {
 public:
  ProgressRenderer(std::shared_ptr<ProgressChannel> channel, std::vector<LaneDisplay> lanes, std::ostream& out,
                   report::Style style);
  ~ProgressRenderer();

  void Start();

  // Closes the channel, drains what is left and joins.
  void Stop();

 private:
  void Run();
  void Render(const ProgressEvent& event);

  std::shared_ptr<ProgressChannel> channel_;
  std::vector<LaneDisplay>         lanes_;
  std::ostream&                    out_;
  report::Style                    style_;
  std::size_t                      name_width_ = 0;

  std::thread thread_;
};

} // namespace prepush::scheduler
