/**************************************************************************
 *   Created: May 26, 2012 8:29:02 PM
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include "Common/Exception.hpp"
#include "Core/Fwd.hpp"
#include "Connector.hpp"
#include "Settings.hpp"
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/signals2.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include <memory>

namespace ecosys {
namespace Interaction {
namespace InteractiveBrokers {

//! Drives one connector against one gateway.
/** Owns the message thread which polls the connector socket. All connector
  * callbacks are called from this thread under the session lock.
  */
class Session : private boost::noncopyable {
 public:
  class ConnectionDoesntExistError : public Lib::CommunicationError {
   public:
    explicit ConnectionDoesntExistError(std::string what)
        : CommunicationError(std::move(what)) {}
  };

  enum ConnectionState {
    //! Not connected.
    /** false-value - connection state could be checked as bool.
      */
    CONNECTION_STATE_NOT_CONNECTED = false,
    //! Connected, but the message thread is not started.
    CONNECTION_STATE_CONNECTED,
    //! Connected and the message thread is working.
    CONNECTION_STATE_READY
  };

  typedef boost::function<void(EClient &)> Request;

 private:
  enum PingState { PING_STATE_IDLE, PING_STATE_REQ, PING_STATE_ACK };

  typedef boost::mutex Mutex;
  typedef Mutex::scoped_lock Lock;
  typedef boost::condition_variable Condition;

 public:
  explicit Session(Connector &, const Settings &, ModuleEventsLog &);
  ~Session();

 public:
  //! Opens the socket and makes the handshake.
  /** Does nothing if already connected.
    * @throw Lib::ConnectError
    */
  void Connect();
  //! Starts the message thread and waits for the first order ID.
  /** @throw Lib::ConnectError
    */
  void Start();
  void Stop();

  //! Sends request from the caller thread.
  /** @throw ConnectionDoesntExistError
    */
  void Invoke(const Request &);

  ::OrderId TakeOrderId();
  TickerId TakeRequestId();

  ConnectionState GetState() const;
  bool IsGatewayLinkActive() const;

  const Settings &GetSettings() const { return m_settings; }

 private:
  void Task();
  bool ProcessMessages();

  void CheckState() const;
  void CheckTimeout();

  void UpdateNextPingRequestTime();
  void UpdateLastRequestTime();
  void UpdateLastResponseTime();
  void RequestCurrentTime();

  void OnError(int id, int code, const std::string &message);
  void OnNextValidId(::OrderId);
  void OnCurrentTime(const boost::posix_time::ptime &);
  void OnConnectionClosed();

  void LogMessage(int id, int code, const std::string &message) const;
  void LogConnectionAttempt() const noexcept;
  void LogConnect() const noexcept;
  void LogDisconnectAttempt() const noexcept;

 private:
  Connector &m_connector;
  const Settings m_settings;
  ModuleEventsLog &m_log;

  mutable Mutex m_mutex;
  Condition m_condition;

  ConnectionState m_connectionState;
  bool m_isGatewayLinkActive;
  PingState m_pingState;
  ::OrderId m_seqNumber;

  boost::posix_time::ptime m_clientNow;
  boost::posix_time::ptime m_nextPingTime;
  boost::posix_time::ptime m_timeoutTime;

  std::unique_ptr<boost::thread> m_thread;

  boost::signals2::scoped_connection m_errorConnection;
  boost::signals2::scoped_connection m_nextValidIdConnection;
  boost::signals2::scoped_connection m_currentTimeConnection;
  boost::signals2::scoped_connection m_connectionClosedConnection;
};

}  // namespace InteractiveBrokers
}  // namespace Interaction
}  // namespace ecosys
