#pragma once
#include <zmq.h>
#include <string>

/**
 * @brief ZeroMQ telemetry publisher
 *
 * Publishes press-loop samples as JSON on the "telemetry" topic.
 * Publish only: the controller takes no commands over the socket.
 *
 * Message format:
 * {"t": <sec>, "cycle": <n>, "state": "IDLE"|"ACTUATING", "angle": <deg>,
 *  "polls": <n>, "detections": <n>, "presses": <n>,
 *  "deadline_miss": <0|1>, "deadline_misses": <n>}
 */
struct TelemetryPub {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* pub{nullptr};  ///< ZeroMQ PUB socket
  std::string address; ///< Endpoint the socket is bound to
  bool connected{false};

  /**
   * @brief Create the publisher socket and bind it
   * @param endpoint ZeroMQ endpoint, e.g. "tcp://127.0.0.1:5556"
   */
  explicit TelemetryPub(const std::string& endpoint = "tcp://127.0.0.1:5556")
    : address(endpoint) {
    ctx = zmq_ctx_new();
    if (ctx == nullptr) return;
    pub = zmq_socket(ctx, ZMQ_PUB);
    if (pub == nullptr) return;
    int linger = 0;
    zmq_setsockopt(pub, ZMQ_LINGER, &linger, sizeof(linger));
    connected = zmq_bind(pub, endpoint.c_str()) == 0;
  }

  ~TelemetryPub() {
    if (pub != nullptr) zmq_close(pub);
    if (ctx != nullptr) zmq_ctx_term(ctx);
  }

  TelemetryPub(const TelemetryPub&) = delete;
  TelemetryPub& operator=(const TelemetryPub&) = delete;

  bool is_connected() const { return connected; }
  const std::string& get_bind_address() const { return address; }

  /**
   * @brief Send one telemetry message
   * @param s JSON string to send
   * @return false if the socket is not bound or the send failed
   */
  bool send(const std::string& s) {
    if (!connected) return false;
    if (zmq_send(pub, "telemetry", 9, ZMQ_SNDMORE) < 0) return false;
    return zmq_send(pub, s.data(), s.size(), 0) >= 0;
  }
};
