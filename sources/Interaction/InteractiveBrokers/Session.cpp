/**************************************************************************
 *   Created: May 26, 2012 8:29:56 PM
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "Session.hpp"
#include "Messages.hpp"

using namespace ecosys;
using namespace ecosys::Lib;
using namespace ecosys::Interaction::InteractiveBrokers;

namespace pt = boost::posix_time;

////////////////////////////////////////////////////////////////////////////////

namespace {
const pt::time_duration maxIterationTime = pt::milliseconds(10);
const pt::time_duration seqNumberWaitTime = pt::milliseconds(100);
}  // namespace

////////////////////////////////////////////////////////////////////////////////

Session::Session(Connector &connector,
                 const Settings &settings,
                 ModuleEventsLog &log)
    : m_connector(connector),
      m_settings(settings),
      m_log(log),
      m_connectionState(connector.isConnected() ? CONNECTION_STATE_CONNECTED
                                                : CONNECTION_STATE_NOT_CONNECTED),
      m_isGatewayLinkActive(true),
      m_pingState(PING_STATE_REQ),
      m_seqNumber(-1) {
  m_errorConnection = m_connector.SubscribeToErrors(
      boost::bind(&Session::OnError, this, _1, _2, _3));
  m_nextValidIdConnection = m_connector.SubscribeToNextValidId(
      boost::bind(&Session::OnNextValidId, this, _1));
  m_currentTimeConnection = m_connector.SubscribeToCurrentTime(
      boost::bind(&Session::OnCurrentTime, this, _1));
  m_connectionClosedConnection = m_connector.SubscribeToConnectionClosed(
      boost::bind(&Session::OnConnectionClosed, this));
}

Session::~Session() {
  try {
    Stop();
  } catch (...) {
    AssertFailNoException();
    std::terminate();
  }
}

void Session::Connect() {
  Lock lock(m_mutex);
  if (m_connectionState) {
    return;
  }

  if (m_thread) {
    // The task has already left its loop as the connection is closed.
    lock.unlock();
    m_thread->join();
    m_thread.reset();
    lock.lock();
  }
  if (m_connector.fd() >= 0) {
    m_connector.eDisconnect();
  }

  m_seqNumber = -1;
  m_isGatewayLinkActive = true;
  m_pingState = PING_STATE_REQ;
  m_nextPingTime = pt::not_a_date_time;
  m_timeoutTime = pt::not_a_date_time;

  LogConnectionAttempt();
  const bool connectResult = m_connector.eConnect(
      m_settings.host.c_str(), m_settings.port, m_settings.clientId);
  AssertEq(connectResult, m_connector.isConnected());
  if (!connectResult || !m_connector.isConnected()) {
    throw ConnectError("Failed to connect to TWS");
  }
  m_connectionState = CONNECTION_STATE_CONNECTED;
  LogConnect();
}

void Session::Start() {
  Lock lock(m_mutex);
  if (m_connectionState == CONNECTION_STATE_READY) {
    return;
  } else if (m_connectionState != CONNECTION_STATE_CONNECTED) {
    throw ConnectionDoesntExistError("Connection doesn't exist");
  }
  Assert(!m_thread);

  m_connectionState = CONNECTION_STATE_READY;

  m_thread.reset(new boost::thread([this]() { Task(); }));
  const bool isInited = m_condition.timed_wait(
      lock, m_settings.timeout,
      [this]() { return m_seqNumber >= 0 || !m_connectionState; });
  if (!isInited || m_seqNumber < 0) {
    m_log.Error("No seqnumber received.");
    m_connectionState = CONNECTION_STATE_NOT_CONNECTED;
    m_condition.notify_all();
    throw ConnectError("No seqnumber received");
  }
}

void Session::Stop() {
  {
    const Lock lock(m_mutex);
    if (!m_thread && !m_connectionState && m_connector.fd() < 0) {
      return;
    }
    LogDisconnectAttempt();
    m_connectionState = CONNECTION_STATE_NOT_CONNECTED;
  }
  m_condition.notify_all();

  if (m_thread) {
    m_thread->join();
    m_thread.reset();
  }

  {
    const Lock lock(m_mutex);
    m_connector.eDisconnect();
    m_seqNumber = -1;
  }

  m_log.Info("Connection with \"%1%:%2%\" (client ID %3%) is closed.",
             m_settings.host, m_settings.port, m_settings.clientId);
}

void Session::Task() {
  m_log.Debug("Started connection task.");
  bool isInited = false;
  pt::ptime nextIterationTime = boost::get_system_time() + maxIterationTime;
  size_t heavyCount = 0;
  for (Lock lock(m_mutex);;) {
    try {
      m_clientNow = boost::get_system_time();
      if (isInited) {
        if (!m_connectionState) {
          break;
        }
        if (nextIterationTime > m_clientNow) {
          heavyCount = 0;
          m_condition.timed_wait(lock, nextIterationTime);
        } else if (++heavyCount == 5 ||
                   (heavyCount > 5 && !(heavyCount % 10))) {
          lock.unlock();
          m_log.Warn(
              "Connection task is heavily loaded"
              " (iterations without sleep: %1%).",
              heavyCount);
          lock.lock();
        }
        m_clientNow = boost::get_system_time();
      }
      nextIterationTime = m_clientNow + maxIterationTime;
      CheckTimeout();
      while (m_connectionState && ProcessMessages()) {
        // Lets requests from other threads go between messages.
        lock.unlock();
        lock.lock();
      }
      if (!isInited && m_connectionState) {
        isInited = m_seqNumber >= 0;
        if (isInited) {
          m_condition.notify_all();
        } else {
          lock.unlock();
          m_log.Debug("Waiting for seqnumber...");
          boost::this_thread::sleep(seqNumberWaitTime);
          lock.lock();
        }
      }
      if (!m_connectionState) {
        m_condition.notify_all();
        break;
      }
    } catch (...) {
      lock.unlock();
      AssertFailNoException();
      throw;
    }
  }
  m_log.Debug("Connection task finished.");
}

bool Session::ProcessMessages() {
  if (m_connector.fd() < 0) {
    m_log.Warn("Connection socket is closed.");
    m_connectionState = CONNECTION_STATE_NOT_CONNECTED;
    return false;
  }

  fd_set readSet;
  fd_set writeSet;
  fd_set errorSet;

  FD_ZERO(&readSet);
  FD_SET(m_connector.fd(), &readSet);

  FD_ZERO(&writeSet);
  if (!m_connector.isOutBufferEmpty()) {
    FD_SET(m_connector.fd(), &writeSet);
  }

  FD_ZERO(&errorSet);
  FD_SET(m_connector.fd(), &errorSet);

  timeval selectWaitTime = {};
  const int selectResult = select(m_connector.fd() + 1, &readSet, &writeSet,
                                  &errorSet, &selectWaitTime);
  if (selectResult == 0) {  // timeout
    return false;
  } else if (selectResult < 0) {
    m_log.Debug("Connection process operation returned DISCONNECT.");
    m_connectionState = CONNECTION_STATE_NOT_CONNECTED;
    return false;
  } else if (m_connector.fd() < 0) {
    return false;
  }

  if (FD_ISSET(m_connector.fd(), &errorSet)) {
    m_connector.onError();
  }
  if (m_connector.fd() >= 0 && FD_ISSET(m_connector.fd(), &writeSet)) {
    m_connector.onSend();
  }
  if (m_connector.fd() >= 0 && FD_ISSET(m_connector.fd(), &readSet)) {
    UpdateLastResponseTime();
    m_connector.onReceive();
  }

  if (m_connector.fd() < 0 && m_connectionState) {
    m_log.Warn("Connection socket is closed.");
    m_connectionState = CONNECTION_STATE_NOT_CONNECTED;
    return false;
  }

  return true;
}

void Session::Invoke(const Request &request) {
  {
    const Lock lock(m_mutex);
    CheckState();
    request(m_connector);
    UpdateLastRequestTime();
  }
  m_condition.notify_all();
}

::OrderId Session::TakeOrderId() {
  const Lock lock(m_mutex);
  CheckState();
  AssertLe(0, m_seqNumber);
  return m_seqNumber++;
}

TickerId Session::TakeRequestId() {
  const Lock lock(m_mutex);
  CheckState();
  AssertLe(0, m_seqNumber);
  return m_seqNumber++;
}

Session::ConnectionState Session::GetState() const {
  const Lock lock(m_mutex);
  return m_connectionState;
}

bool Session::IsGatewayLinkActive() const {
  const Lock lock(m_mutex);
  return m_isGatewayLinkActive;
}

void Session::CheckState() const {
  if (m_connectionState == CONNECTION_STATE_READY && m_seqNumber < 0) {
    m_log.Error("No seqnumber specified.");
  }
  if (m_connectionState != CONNECTION_STATE_READY || m_seqNumber < 0) {
    throw ConnectionDoesntExistError("Connection doesn't exist");
  }
}

void Session::CheckTimeout() {
  if (m_timeoutTime != pt::not_a_date_time && m_timeoutTime <= m_clientNow) {
    m_log.Error("Connection TIMEOUT!");
    // No reconnect, asks server time again to find out when the gateway
    // answers.
    m_timeoutTime = pt::not_a_date_time;
    m_pingState = PING_STATE_REQ;
  }
  switch (m_pingState) {
    case PING_STATE_IDLE:
      Assert(m_nextPingTime != pt::not_a_date_time);
      if (m_nextPingTime > m_clientNow) {
        break;
      }
    /* no break! */
    case PING_STATE_REQ:
      RequestCurrentTime();
      break;
    default:
      AssertEq(PING_STATE_ACK, m_pingState);
      break;
  }
}

void Session::UpdateNextPingRequestTime() {
  m_nextPingTime = boost::get_system_time() + m_settings.pingPeriod;
  m_timeoutTime = pt::not_a_date_time;
}

void Session::UpdateLastRequestTime() {
  if (m_timeoutTime != pt::not_a_date_time) {
    return;
  }
  m_timeoutTime = boost::get_system_time() + m_settings.timeout;
}

void Session::UpdateLastResponseTime() {
  if (m_pingState == PING_STATE_ACK) {
    // Timeout is reset only by the server time.
    return;
  }
  UpdateNextPingRequestTime();
}

void Session::RequestCurrentTime() {
  m_pingState = PING_STATE_ACK;
  m_connector.reqCurrentTime();
  UpdateLastRequestTime();
}

////////////////////////////////////////////////////////////////////////////////

void Session::OnError(int id, int code, const std::string &message) {
  LogMessage(id, code, message);
  if (IsLinkLostCode(code)) {
    m_isGatewayLinkActive = false;
  } else if (IsLinkRestoredCode(code)) {
    m_isGatewayLinkActive = true;
  } else if (IsConnectionDroppedCode(code) && m_connectionState) {
    m_connectionState = CONNECTION_STATE_NOT_CONNECTED;
    m_condition.notify_all();
  }
}

void Session::OnNextValidId(::OrderId id) {
  const auto prevVal = m_seqNumber;
  m_seqNumber = id;
  if (prevVal != -1) {
    m_log.Debug("Next order ID: %1% -> %2%.", prevVal, m_seqNumber);
  } else {
    m_log.Debug("Next order ID: %1%.", m_seqNumber);
  }
}

void Session::OnCurrentTime(const pt::ptime &time) {
  if (m_pingState != PING_STATE_ACK) {
    m_log.Warn("Server current time arrived without request: %1%.", time);
    return;
  }
  m_log.Info("Server current time: %1%.", time);
  UpdateNextPingRequestTime();
  m_pingState = PING_STATE_IDLE;
}

void Session::OnConnectionClosed() {
  if (!m_connectionState) {
    return;
  }
  m_log.Warn("Connection with \"%1%:%2%\" (client ID %3%) closed by gateway.",
             m_settings.host, m_settings.port, m_settings.clientId);
  m_connectionState = CONNECTION_STATE_NOT_CONNECTED;
  m_condition.notify_all();
}

////////////////////////////////////////////////////////////////////////////////

void Session::LogMessage(int id,
                         int code,
                         const std::string &message) const {
  const auto &text = FormatMessageText(message);
  switch (GetMessageSeverity(code)) {
    case MESSAGE_SEVERITY_SILENT:
      break;
    case MESSAGE_SEVERITY_DEBUG:
      m_log.Debug("\"%1%\" (error code: %2%, order or ticket ID: %3%).", text,
                  code, id);
      break;
    case MESSAGE_SEVERITY_INFO:
      m_log.Info("\"%1%\" (error code: %2%, order or ticket ID: %3%).", text,
                 code, id);
      break;
    case MESSAGE_SEVERITY_WARN:
      m_log.Warn("\"%1%\" (error code: %2%, order or ticket ID: %3%).", text,
                 code, id);
      break;
    case MESSAGE_SEVERITY_ERROR:
    default:
      if (code == 502) {
        m_log.Error("Couldn't connect to TWS: \"%1%\".", text);
      } else {
        m_log.Error("\"%1%\" (error code: %2%, order or ticket ID: %3%).",
                    text, code, id);
      }
      break;
  }
}

void Session::LogConnectionAttempt() const noexcept {
  m_log.Debug("Connecting to \"%1%:%2%\" with client ID %3%...",
              m_settings.host, m_settings.port, m_settings.clientId);
}

void Session::LogConnect() const noexcept {
  m_log.Info("Connected to \"%1%:%2%\" with client ID %3%.", m_settings.host,
             m_settings.port, m_settings.clientId);
}

void Session::LogDisconnectAttempt() const noexcept {
  m_log.Debug("Disconnecting from \"%1%:%2%\" with client ID %3%...",
              m_settings.host, m_settings.port, m_settings.clientId);
}

////////////////////////////////////////////////////////////////////////////////
