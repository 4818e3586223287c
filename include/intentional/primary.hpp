#ifndef INTENTIONAL_PRIMARY_HPP
#define INTENTIONAL_PRIMARY_HPP

#include "intentional/message_dispatcher.hpp"
#include "intentional/socket_server.hpp"

#include <chrono>
#include <filesystem>

namespace intentional {

// The application window lives outside this process's core; the primary
// only forwards show requests to it.
class WindowPresenter {
public:
  virtual ~WindowPresenter() = default;
  virtual void show() = 0;
};

class LoggingPresenter : public WindowPresenter {
public:
  void show() override;
};

// Long-lived instance: serves relay connections and linearizes every
// decoded message onto the TaskRunner queue.
class Primary {
public:
  Primary(std::filesystem::path socketPath, MessageHandler &handler,
          WindowPresenter &presenter);
  ~Primary();

  bool start();

  // Polls lifecycle requests until a clean quit is requested
  void runUntilQuit(std::chrono::milliseconds tick = std::chrono::milliseconds(100));

  // Stops the server and drains queued messages
  void stop();

  SocketServer &server() { return server_; }

private:
  void onMessage(std::shared_ptr<NativeHostSession> session,
                 nlohmann::json message);

  MessageDispatcher dispatcher_;
  WindowPresenter &presenter_;
  SocketServer server_;
};

} // namespace intentional

#endif // INTENTIONAL_PRIMARY_HPP
