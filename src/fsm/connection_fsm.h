/**
 * @file connection_fsm.h
 * @brief ETL-based connection state machine for the SceneLink Controller.
 *
 * All Controller connectivity transitions go through this machine; observers
 * learn about them through ConnectionObserver::onStateEntered, never by
 * polling.
 *
 * States:
 *   - Disconnected (0): Idle. Discovery polling may or may not be running.
 *   - Connecting (1): A transport handshake is in flight.
 *   - Connected (2): The channel is open; commands may be sent.
 *   - Reconnecting (3): The channel closed; waiting for the next attempt.
 *
 * Events:
 *   - EvConnect: Fresh record found / retry delay elapsed → Connecting
 *   - EvOpened: Handshake completed → Connected
 *   - EvConnectFailed: Handshake failed or timed out → Disconnected, or back
 *     to Reconnecting when the attempt belonged to a reconnect cycle
 *   - EvSocketClosed: Open channel closed for any reason → Reconnecting
 *   - EvGiveUp: Reconnect budget exhausted → Disconnected
 *   - EvReset: User disconnect / manual retry → Disconnected
 */
#ifndef SCENELINK_CONNECTION_FSM_H
#define SCENELINK_CONNECTION_FSM_H

#include "etl/fsm.h"
#include "etl/message.h"

namespace scenelink {
namespace fsm {

class ConnectionFsm;

// ============================================================================
// State IDs - Must be sequential starting from 0
// ============================================================================
enum StateId : etl::fsm_state_id_t {
  STATE_DISCONNECTED = 0,
  STATE_CONNECTING = 1,
  STATE_CONNECTED = 2,
  STATE_RECONNECTING = 3,
  NUMBER_OF_STATES = 4
};

inline const char* stateName(etl::fsm_state_id_t id) {
  switch (id) {
    case STATE_DISCONNECTED: return "disconnected";
    case STATE_CONNECTING:   return "connecting";
    case STATE_CONNECTED:    return "connected";
    case STATE_RECONNECTING: return "reconnecting";
    default:                 return "invalid";
  }
}

// ============================================================================
// Event IDs
// ============================================================================
enum EventId : etl::message_id_t {
  EVENT_CONNECT = 0,
  EVENT_OPENED = 1,
  EVENT_CONNECT_FAILED = 2,
  EVENT_SOCKET_CLOSED = 3,
  EVENT_GIVE_UP = 4,
  EVENT_RESET = 5
};

struct EvConnect : public etl::message<EVENT_CONNECT> {};
struct EvOpened : public etl::message<EVENT_OPENED> {};
struct EvConnectFailed : public etl::message<EVENT_CONNECT_FAILED> {
  explicit EvConnectFailed(bool resume) : resume_reconnect(resume) {}
  bool resume_reconnect;
};
struct EvSocketClosed : public etl::message<EVENT_SOCKET_CLOSED> {};
struct EvGiveUp : public etl::message<EVENT_GIVE_UP> {};
struct EvReset : public etl::message<EVENT_RESET> {};

class ConnectionObserver {
 public:
  virtual ~ConnectionObserver() {}
  virtual void onStateEntered(StateId state) = 0;
};

// ============================================================================
// State: Disconnected (Initial State)
// ============================================================================
class StateDisconnected : public etl::fsm_state<ConnectionFsm, StateDisconnected, STATE_DISCONNECTED,
                                                EvConnect, EvReset>
{
 public:
  etl::fsm_state_id_t on_enter_state();

  etl::fsm_state_id_t on_event(const EvConnect&) {
    return STATE_CONNECTING;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return No_State_Change;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Connecting
// ============================================================================
class StateConnecting : public etl::fsm_state<ConnectionFsm, StateConnecting, STATE_CONNECTING,
                                              EvOpened, EvConnectFailed, EvReset>
{
 public:
  etl::fsm_state_id_t on_enter_state();

  etl::fsm_state_id_t on_event(const EvOpened&) {
    return STATE_CONNECTED;
  }

  etl::fsm_state_id_t on_event(const EvConnectFailed& event) {
    return event.resume_reconnect ? STATE_RECONNECTING : STATE_DISCONNECTED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_DISCONNECTED;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Connected
// ============================================================================
class StateConnected : public etl::fsm_state<ConnectionFsm, StateConnected, STATE_CONNECTED,
                                             EvSocketClosed, EvReset>
{
 public:
  etl::fsm_state_id_t on_enter_state();

  etl::fsm_state_id_t on_event(const EvSocketClosed&) {
    return STATE_RECONNECTING;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_DISCONNECTED;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Reconnecting
// ============================================================================
class StateReconnecting : public etl::fsm_state<ConnectionFsm, StateReconnecting, STATE_RECONNECTING,
                                                EvConnect, EvGiveUp, EvReset>
{
 public:
  etl::fsm_state_id_t on_enter_state();

  etl::fsm_state_id_t on_event(const EvConnect&) {
    return STATE_CONNECTING;
  }

  etl::fsm_state_id_t on_event(const EvGiveUp&) {
    return STATE_DISCONNECTED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_DISCONNECTED;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// FSM Class
// ============================================================================
class ConnectionFsm : public etl::fsm
{
 public:
  ConnectionFsm()
    : etl::fsm(NUMBER_OF_STATES)
    , _observer(nullptr)
    , _state_list{}
  {
  }

  // States are members, not statics: every Controller owns its own machine.
  void begin() {
    _state_list[STATE_DISCONNECTED] = &_state_disconnected;
    _state_list[STATE_CONNECTING] = &_state_connecting;
    _state_list[STATE_CONNECTED] = &_state_connected;
    _state_list[STATE_RECONNECTING] = &_state_reconnecting;

    set_states(_state_list, NUMBER_OF_STATES);
    start();
  }

  void setObserver(ConnectionObserver* observer) { _observer = observer; }

  // State Accessors
  StateId state() const { return static_cast<StateId>(get_state_id()); }
  bool isDisconnected() const { return get_state_id() == STATE_DISCONNECTED; }
  bool isConnecting() const { return get_state_id() == STATE_CONNECTING; }
  bool isConnected() const { return get_state_id() == STATE_CONNECTED; }
  bool isReconnecting() const { return get_state_id() == STATE_RECONNECTING; }

  // Event Triggers
  void connect() { receive(EvConnect()); }
  void opened() { receive(EvOpened()); }
  void connectFailed(bool resume_reconnect) { receive(EvConnectFailed(resume_reconnect)); }
  void socketClosed() { receive(EvSocketClosed()); }
  void giveUp() { receive(EvGiveUp()); }
  void resetFsm() { receive(EvReset()); }

  void notifyEntered(StateId state) {
    if (_observer != nullptr) {
      _observer->onStateEntered(state);
    }
  }

 private:
  ConnectionObserver* _observer;
  StateDisconnected _state_disconnected;
  StateConnecting _state_connecting;
  StateConnected _state_connected;
  StateReconnecting _state_reconnecting;
  etl::ifsm_state* _state_list[NUMBER_OF_STATES];
};

inline etl::fsm_state_id_t StateDisconnected::on_enter_state() {
  get_fsm_context().notifyEntered(STATE_DISCONNECTED);
  return STATE_DISCONNECTED;
}

inline etl::fsm_state_id_t StateConnecting::on_enter_state() {
  get_fsm_context().notifyEntered(STATE_CONNECTING);
  return STATE_CONNECTING;
}

inline etl::fsm_state_id_t StateConnected::on_enter_state() {
  get_fsm_context().notifyEntered(STATE_CONNECTED);
  return STATE_CONNECTED;
}

inline etl::fsm_state_id_t StateReconnecting::on_enter_state() {
  get_fsm_context().notifyEntered(STATE_RECONNECTING);
  return STATE_RECONNECTING;
}

}  // namespace fsm
}  // namespace scenelink

#endif  // SCENELINK_CONNECTION_FSM_H
