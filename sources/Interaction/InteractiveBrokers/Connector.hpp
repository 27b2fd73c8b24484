/**************************************************************************
 *   Created: 2017/08/13 19:04:51
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include <EPosixClientSocket.h>
#include <EWrapper.h>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/function.hpp>
#include <boost/signals2.hpp>
#include <string>

namespace ecosys {
namespace Interaction {
namespace InteractiveBrokers {

//! TWS API requester and callback sink in one object.
/** The EWrapper base is declared first, so it is constructed before the
  * client socket receives the pointer to it. Construction doesn't open a
  * socket and doesn't send anything.
  *
  * Callbacks which are required to drive a connection are also routed to
  * signals. Other callbacks do nothing and may be overridden. An override of
  * a routed callback has to call the base implementation.
  */
class Connector : public EWrapper, public EPosixClientSocket {
 public:
  typedef void(ErrorSlotSignature)(int id,
                                   int code,
                                   const std::string &message);
  typedef boost::function<ErrorSlotSignature> ErrorSlot;

  typedef void(NextValidIdSlotSignature)(::OrderId);
  typedef boost::function<NextValidIdSlotSignature> NextValidIdSlot;

  typedef void(CurrentTimeSlotSignature)(const boost::posix_time::ptime &);
  typedef boost::function<CurrentTimeSlotSignature> CurrentTimeSlot;

  typedef void(ConnectionClosedSlotSignature)();
  typedef boost::function<ConnectionClosedSlotSignature> ConnectionClosedSlot;

 public:
  Connector();
  virtual ~Connector();

 public:
  //! Callback target which the requester half delivers replies to.
  EWrapper *GetCallbackTarget() const { return getWrapper(); }

  boost::signals2::connection SubscribeToErrors(const ErrorSlot &);
  boost::signals2::connection SubscribeToNextValidId(const NextValidIdSlot &);
  boost::signals2::connection SubscribeToCurrentTime(const CurrentTimeSlot &);
  boost::signals2::connection SubscribeToConnectionClosed(
      const ConnectionClosedSlot &);

 public:
  void tickPrice(TickerId, TickType, double, int) override;
  void tickSize(TickerId, TickType, int) override;
  void tickOptionComputation(TickerId,
                             TickType,
                             double,
                             double,
                             double,
                             double,
                             double,
                             double,
                             double,
                             double) override;
  void tickGeneric(TickerId, TickType, double) override;
  void tickString(TickerId, TickType, const IBString &) override;
  void tickEFP(TickerId,
               TickType,
               double,
               const IBString &,
               double,
               int,
               const IBString &,
               double,
               double) override;
  void orderStatus(::OrderId,
                   const IBString &,
                   int,
                   int,
                   double,
                   int,
                   int,
                   double,
                   int,
                   const IBString &) override;
  void openOrder(::OrderId,
                 const Contract &,
                 const Order &,
                 const OrderState &) override;
  void openOrderEnd() override;
  void winError(const IBString &, int) override;
  void connectionClosed() override;
  void updateAccountValue(const IBString &,
                          const IBString &,
                          const IBString &,
                          const IBString &) override;
  void updatePortfolio(const Contract &,
                       int,
                       double,
                       double,
                       double,
                       double,
                       double,
                       const IBString &) override;
  void updateAccountTime(const IBString &) override;
  void accountDownloadEnd(const IBString &) override;
  void nextValidId(::OrderId) override;
  void contractDetails(int, const ContractDetails &) override;
  void bondContractDetails(int, const ContractDetails &) override;
  void contractDetailsEnd(int) override;
  void execDetails(int, const Contract &, const Execution &) override;
  void execDetailsEnd(int) override;
  void error(const int, const int, const IBString) override;
  void updateMktDepth(TickerId, int, int, int, double, int) override;
  void updateMktDepthL2(
      TickerId, int, IBString, int, int, double, int) override;
  void updateNewsBulletin(int,
                          int,
                          const IBString &,
                          const IBString &) override;
  void managedAccounts(const IBString &) override;
  void receiveFA(faDataType, const IBString &) override;
  void historicalData(TickerId,
                      const IBString &,
                      double,
                      double,
                      double,
                      double,
                      int,
                      int,
                      double,
                      int) override;
  void scannerParameters(const IBString &) override;
  void scannerData(int,
                   int,
                   const ContractDetails &,
                   const IBString &,
                   const IBString &,
                   const IBString &,
                   const IBString &) override;
  void scannerDataEnd(int) override;
  void realtimeBar(TickerId,
                   long,
                   double,
                   double,
                   double,
                   double,
                   long,
                   double,
                   int) override;
  void currentTime(long) override;
  void fundamentalData(TickerId, const IBString &) override;
  void deltaNeutralValidation(int, const UnderComp &) override;
  void tickSnapshotEnd(int) override;
  void marketDataType(TickerId, int) override;
  void commissionReport(const CommissionReport &) override;
  void position(const IBString &, const Contract &, int, double) override;
  void positionEnd() override;
  void accountSummary(int,
                      const IBString &,
                      const IBString &,
                      const IBString &,
                      const IBString &) override;
  void accountSummaryEnd(int) override;
  void verifyMessageAPI(const IBString &) override;
  void verifyCompleted(bool, const IBString &) override;
  void displayGroupList(int, const IBString &) override;
  void displayGroupUpdated(int, const IBString &) override;

 private:
  boost::signals2::signal<ErrorSlotSignature> m_errorSignal;
  boost::signals2::signal<NextValidIdSlotSignature> m_nextValidIdSignal;
  boost::signals2::signal<CurrentTimeSlotSignature> m_currentTimeSignal;
  boost::signals2::signal<ConnectionClosedSlotSignature>
      m_connectionClosedSignal;
};

}  // namespace InteractiveBrokers
}  // namespace Interaction
}  // namespace ecosys
