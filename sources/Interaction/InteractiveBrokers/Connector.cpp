/**************************************************************************
 *   Created: 2017/08/13 19:05:17
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "Connector.hpp"

using namespace ecosys;
using namespace ecosys::Interaction::InteractiveBrokers;

namespace pt = boost::posix_time;

////////////////////////////////////////////////////////////////////////////////

Connector::Connector() : EPosixClientSocket(this) {
  Assert(getWrapper() == static_cast<EWrapper *>(this));
}

Connector::~Connector() = default;

boost::signals2::connection Connector::SubscribeToErrors(
    const ErrorSlot &slot) {
  return m_errorSignal.connect(slot);
}

boost::signals2::connection Connector::SubscribeToNextValidId(
    const NextValidIdSlot &slot) {
  return m_nextValidIdSignal.connect(slot);
}

boost::signals2::connection Connector::SubscribeToCurrentTime(
    const CurrentTimeSlot &slot) {
  return m_currentTimeSignal.connect(slot);
}

boost::signals2::connection Connector::SubscribeToConnectionClosed(
    const ConnectionClosedSlot &slot) {
  return m_connectionClosedSignal.connect(slot);
}

////////////////////////////////////////////////////////////////////////////////

void Connector::error(const int id, const int code, const IBString message) {
  m_errorSignal(id, code, message);
}

void Connector::winError(const IBString &message, int code) {
  m_errorSignal(-1, code, message);
}

void Connector::nextValidId(::OrderId id) { m_nextValidIdSignal(id); }

void Connector::currentTime(long time) {
  m_currentTimeSignal(pt::from_time_t(time));
}

void Connector::connectionClosed() { m_connectionClosedSignal(); }

////////////////////////////////////////////////////////////////////////////////

void Connector::tickPrice(TickerId, TickType, double, int) {}

void Connector::tickSize(TickerId, TickType, int) {}

void Connector::tickOptionComputation(TickerId /*tickerId*/,
                                      TickType /*tickType*/,
                                      double /*impliedVol*/,
                                      double /*delta*/,
                                      double /*optPrice*/,
                                      double /*pvDividend*/,
                                      double /*gamma*/,
                                      double /*vega*/,
                                      double /*theta*/,
                                      double /*undPrice*/) {}

void Connector::tickGeneric(TickerId, TickType, double) {}

void Connector::tickString(TickerId, TickType, const IBString &) {}

void Connector::tickEFP(TickerId /*tickerId*/,
                        TickType /*tickType*/,
                        double /*basisPoints*/,
                        const IBString & /*formattedBasisPoints*/,
                        double /*totalDividends*/,
                        int /*holdDays*/,
                        const IBString & /*futureExpiry*/,
                        double /*dividendImpact*/,
                        double /*dividendsToExpiry*/) {}

void Connector::orderStatus(::OrderId /*orderId*/,
                            const IBString & /*status*/,
                            int /*filled*/,
                            int /*remaining*/,
                            double /*avgFillPrice*/,
                            int /*permId*/,
                            int /*parentId*/,
                            double /*lastFillPrice*/,
                            int /*clientId*/,
                            const IBString & /*whyHeld*/) {}

void Connector::openOrder(::OrderId,
                          const Contract &,
                          const Order &,
                          const OrderState &) {}

void Connector::openOrderEnd() {}

void Connector::updateAccountValue(const IBString & /*key*/,
                                   const IBString & /*val*/,
                                   const IBString & /*currency*/,
                                   const IBString & /*accountName*/) {}

void Connector::updatePortfolio(const Contract & /*contract*/,
                                int /*position*/,
                                double /*marketPrice*/,
                                double /*marketValue*/,
                                double /*averageCost*/,
                                double /*unrealizedPnl*/,
                                double /*realizedPnl*/,
                                const IBString & /*accountName*/) {}

void Connector::updateAccountTime(const IBString &) {}

void Connector::accountDownloadEnd(const IBString &) {}

void Connector::contractDetails(int, const ContractDetails &) {}

void Connector::bondContractDetails(int, const ContractDetails &) {}

void Connector::contractDetailsEnd(int) {}

void Connector::execDetails(int, const Contract &, const Execution &) {}

void Connector::execDetailsEnd(int) {}

void Connector::updateMktDepth(TickerId /*tickerId*/,
                               int /*position*/,
                               int /*operation*/,
                               int /*side*/,
                               double /*price*/,
                               int /*size*/) {}

void Connector::updateMktDepthL2(TickerId /*tickerId*/,
                                 int /*position*/,
                                 IBString /*marketMaker*/,
                                 int /*operation*/,
                                 int /*side*/,
                                 double /*price*/,
                                 int /*size*/) {}

void Connector::updateNewsBulletin(int /*msgId*/,
                                   int /*msgType*/,
                                   const IBString & /*newsMessage*/,
                                   const IBString & /*originExch*/) {}

void Connector::managedAccounts(const IBString &) {}

void Connector::receiveFA(faDataType, const IBString &) {}

void Connector::historicalData(TickerId /*reqId*/,
                               const IBString & /*date*/,
                               double /*open*/,
                               double /*high*/,
                               double /*low*/,
                               double /*close*/,
                               int /*volume*/,
                               int /*barCount*/,
                               double /*WAP*/,
                               int /*hasGaps*/) {}

void Connector::scannerParameters(const IBString &) {}

void Connector::scannerData(int /*reqId*/,
                            int /*rank*/,
                            const ContractDetails & /*contractDetails*/,
                            const IBString & /*distance*/,
                            const IBString & /*benchmark*/,
                            const IBString & /*projection*/,
                            const IBString & /*legsStr*/) {}

void Connector::scannerDataEnd(int) {}

void Connector::realtimeBar(TickerId /*reqId*/,
                            long /*time*/,
                            double /*open*/,
                            double /*high*/,
                            double /*low*/,
                            double /*close*/,
                            long /*volume*/,
                            double /*wap*/,
                            int /*count*/) {}

void Connector::fundamentalData(TickerId, const IBString &) {}

void Connector::deltaNeutralValidation(int, const UnderComp &) {}

void Connector::tickSnapshotEnd(int) {}

void Connector::marketDataType(TickerId, int) {}

void Connector::commissionReport(const CommissionReport &) {}

void Connector::position(const IBString & /*account*/,
                         const Contract & /*contract*/,
                         int /*position*/,
                         double /*avgCost*/) {}

void Connector::positionEnd() {}

void Connector::accountSummary(int /*reqId*/,
                               const IBString & /*account*/,
                               const IBString & /*tag*/,
                               const IBString & /*value*/,
                               const IBString & /*currency*/) {}

void Connector::accountSummaryEnd(int) {}

void Connector::verifyMessageAPI(const IBString &) {}

void Connector::verifyCompleted(bool, const IBString &) {}

void Connector::displayGroupList(int, const IBString &) {}

void Connector::displayGroupUpdated(int, const IBString &) {}

////////////////////////////////////////////////////////////////////////////////
