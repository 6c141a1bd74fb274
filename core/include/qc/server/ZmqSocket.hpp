#pragma once
#include <string>
#include <vector>

namespace qc {

// Owns a libzmq context. Throws std::runtime_error if it cannot be created.
class ZmqContext {
public:
  ZmqContext();
  ~ZmqContext();

  ZmqContext(const ZmqContext&) = delete;
  ZmqContext& operator=(const ZmqContext&) = delete;

  void* raw() const { return ctx_; }

private:
  void* ctx_{nullptr};
};

enum class RecvStatus {
  Received,
  Timeout,
  Error
};

// Owns one libzmq socket. The constructor throws std::runtime_error when the
// socket cannot be created; every other call reports failure by return value
// and leaves the reason in lastError().
class ZmqSocket {
public:
  ZmqSocket(ZmqContext& ctx, int type);
  ~ZmqSocket();

  ZmqSocket(const ZmqSocket&) = delete;
  ZmqSocket& operator=(const ZmqSocket&) = delete;

  bool setIdentity(const std::string& identity);
  bool setReceiveTimeout(int ms);
  bool setLinger(int ms);
  bool connect(const std::string& endpoint);

  bool sendMultipart(const std::vector<std::string>& frames);
  RecvStatus recvMultipart(std::vector<std::string>& frames);

  const std::string& lastError() const { return lastError_; }

private:
  void* sock_{nullptr};
  std::string lastError_;

  bool check(int rc, const char* what);
};

} // namespace qc
