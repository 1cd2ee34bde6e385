#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include "core/Errors.h"
#include "mcp/Socket.h"

/**
 * 测试用 socket:由测试代码触发事件,记录发送的文本。
 */
class FakeSocket : public Socket {
public:
  std::atomic<bool> open{false};
  std::atomic<int> connectCalls{0};
  std::atomic<int> closeCalls{0};

  void connect() override { ++connectCalls; }
  bool isOpen() const override { return open.load(); }

  void sendText(const std::string& text) override {
    if (!open) throw TransportError("WebSocket is not open");
    std::lock_guard<std::mutex> lock(mtx);
    sent.push_back(text);
  }

  void close() override {
    ++closeCalls;
    open = false;
  }

  std::vector<std::string> sentTexts() {
    std::lock_guard<std::mutex> lock(mtx);
    return sent;
  }

  void simulateOpen() {
    open = true;
    emitOpen();
  }

  void simulateText(const std::string& text) { emitText(text); }

  void simulateClose(int code = 1006, const std::string& reason = "") {
    open = false;
    emitClose(code, reason);
  }

  void simulateError(const std::string& reason) { emitError(reason); }

private:
  std::mutex mtx;
  std::vector<std::string> sent;
};
