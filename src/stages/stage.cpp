#include "stages/stage.hpp"
#include <iostream>

#include <utility>

namespace fsp {

Stage::Stage(std::string name)
    : name_(std::move(name)), runner_(name_) {}

Stage::~Stage() = default;

void Stage::start(StopToken global_stop) {
  runner_.start(global_stop, [this](const StopToken& g, const std::atomic_bool& l) {
    std::cout << "[" << name_ << "]: Started!" << std::endl;
    run(g, l);
    std::cout << "[" << name_ << "]: Stopped!" << std::endl;
  });
}

void Stage::stop() {
  runner_.request_stop();
  runner_.join();
}

void Stage::join() {
  runner_.join();
}

} // namespace fsp
