#include "intentional/primary.hpp"
#include "intentional/lifecycle.hpp"
#include "intentional/logger.hpp"
#include "intentional/task_runner.hpp"

#include <thread>

namespace intentional {

void LoggingPresenter::show() { LOG_INFO("Show window requested"); }

Primary::Primary(std::filesystem::path socketPath, MessageHandler &handler,
                 WindowPresenter &presenter)
    : dispatcher_(handler), presenter_(presenter),
      server_(std::move(socketPath),
              [this](std::shared_ptr<NativeHostSession> session,
                     nlohmann::json message) {
                onMessage(std::move(session), std::move(message));
              }) {}

Primary::~Primary() { stop(); }

bool Primary::start() { return server_.start(); }

void Primary::onMessage(std::shared_ptr<NativeHostSession> session,
                        nlohmann::json message) {
  TaskRunner::instance().post(
      [this, session = std::move(session), message = std::move(message)] {
        for (const auto &reply : dispatcher_.dispatch(message)) {
          if (!session->send(reply))
            break;
        }
      });
}

void Primary::runUntilQuit(std::chrono::milliseconds tick) {
  LOG_INFO("Primary running");
  while (!Lifecycle::quitRequested()) {
    if (Lifecycle::consumeShowRequest())
      presenter_.show();
    std::this_thread::sleep_for(tick);
  }
  LOG_INFO("Clean quit requested");
}

void Primary::stop() {
  server_.stop();
  TaskRunner::instance().shutdown();
}

} // namespace intentional
