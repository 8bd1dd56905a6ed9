/**
 * @file message_router.h
 * @brief ETL-based router for decoded SceneLink wire messages.
 *
 * Both halves feed every inbound text frame through route(). The frame is
 * decoded once and dispatched by tag; frames that fail to decode go to
 * onMalformed and are dropped there. A malformed frame never closes the
 * connection.
 *
 * Message IDs:
 *   - MSG_REQUEST (0): Agent side, executed by the command dispatcher
 *   - MSG_RESPONSE (1): Controller side, resolves a pending request
 *   - MSG_EVENT (2): Controller side, republished per event kind
 *   - MSG_MALFORMED (3): Undecodable frame
 */
#ifndef SCENELINK_MESSAGE_ROUTER_H
#define SCENELINK_MESSAGE_ROUTER_H

#include <string>

#include "etl/message.h"
#include "etl/message_router.h"
#include "protocol/bridge_message.h"

namespace scenelink {
namespace router {

enum MessageId : etl::message_id_t {
  MSG_REQUEST = 0,
  MSG_RESPONSE = 1,
  MSG_EVENT = 2,
  MSG_MALFORMED = 3,
  NUMBER_OF_MESSAGES = 4
};

// Pointers avoid copying the decoded envelope during routing.
struct MsgRequest : public etl::message<MSG_REQUEST> {
  const rpc::Request* request;
  explicit MsgRequest(const rpc::Request& r) : request(&r) {}
};

struct MsgResponse : public etl::message<MSG_RESPONSE> {
  const rpc::Response* response;
  explicit MsgResponse(const rpc::Response& r) : response(&r) {}
};

struct MsgEvent : public etl::message<MSG_EVENT> {
  const rpc::Event* event;
  explicit MsgEvent(const rpc::Event& e) : event(&e) {}
};

struct MsgMalformed : public etl::message<MSG_MALFORMED> {
  const std::string* raw;
  rpc::MessageError error;
  MsgMalformed(const std::string& text, rpc::MessageError e) : raw(&text), error(e) {}
};

// ============================================================================
// Handler Interface - Controller and Agent implement this
// ============================================================================
class IMessageHandler {
 public:
  virtual ~IMessageHandler() {}
  virtual void onRequest(const rpc::Request& request) = 0;
  virtual void onResponse(const rpc::Response& response) = 0;
  virtual void onEvent(const rpc::Event& event) = 0;
  virtual void onMalformed(const std::string& raw, rpc::MessageError error) = 0;
};

class MessageRouter : public etl::message_router<MessageRouter,
                                                 MsgRequest,
                                                 MsgResponse,
                                                 MsgEvent,
                                                 MsgMalformed>
{
 public:
  MessageRouter()
    : message_router(ROUTER_ID)
    , _handler(nullptr)
  {
  }

  void setHandler(IMessageHandler* handler) {
    _handler = handler;
  }

  // Decode one text frame and dispatch it by tag.
  void route(const std::string& text) {
    etl::expected<rpc::Message, rpc::MessageError> decoded = rpc::decodeMessage(text);
    if (!decoded.has_value()) {
      receive(MsgMalformed(text, decoded.error()));
      return;
    }
    const rpc::Message& message = decoded.value();
    switch (message.type) {
      case rpc::MessageType::REQUEST:  receive(MsgRequest(message.request));   break;
      case rpc::MessageType::RESPONSE: receive(MsgResponse(message.response)); break;
      case rpc::MessageType::EVENT:    receive(MsgEvent(message.event));       break;
    }
  }

  // ETL message handlers - dispatch to IMessageHandler
  void on_receive(const MsgRequest& msg)   { if (_handler) _handler->onRequest(*msg.request); }
  void on_receive(const MsgResponse& msg)  { if (_handler) _handler->onResponse(*msg.response); }
  void on_receive(const MsgEvent& msg)     { if (_handler) _handler->onEvent(*msg.event); }
  void on_receive(const MsgMalformed& msg) { if (_handler) _handler->onMalformed(*msg.raw, msg.error); }

  void on_receive_unknown(const etl::imessage&) {
    // Every decoded tag maps to a message above.
  }

 private:
  static constexpr etl::message_router_id_t ROUTER_ID = 1;
  IMessageHandler* _handler;
};

}  // namespace router
}  // namespace scenelink

#endif  // SCENELINK_MESSAGE_ROUTER_H
