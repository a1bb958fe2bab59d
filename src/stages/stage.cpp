#include "stages/stage.hpp"
#include <iostream>

#include <stdexcept>
#include <utility>

namespace occ {

Stage::Stage(std::string name)
    : name_(std::move(name)), runner_(name_) {}

Stage::~Stage() = default;

void Stage::start(StopSource& global_stop) {
  std::cout << name_ << " started" << std::endl;

  StopSource* source = &global_stop;
  runner_.start(global_stop.token(), [this, source](const StopToken& g, const std::atomic_bool& l) {
    try {
      run(g, l);
    } catch (const std::exception& e) {
      source->request_stop(name_ + " failed: " + e.what());
      throw;
    }
  });
}

void Stage::stop() {
  if (!runner_.joinable()) return;

  runner_.request_stop();
  runner_.join();

  if (runner_.failed()) {
    std::cerr << name_ << " stopped after failure: " << runner_.error() << std::endl;
  } else {
    std::cout << name_ << " stopped" << std::endl;
  }
}

} // namespace occ
