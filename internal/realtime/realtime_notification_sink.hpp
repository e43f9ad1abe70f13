#pragma once

#include <memory>

#include "dispatch/realtime/v1/messages.pb.h"
#include "internal/engine/notification_sink.hpp"

namespace dispatch::realtime {

class RealtimeGateway;

// new_order_request for the order, without the per-driver pickup fields.
dispatch::realtime::v1::ServerMessage OfferMessage(const db::model::OrderRecord& order, uint32_t attempt);

dispatch::realtime::v1::ServerMessage OrderUpdateMessage(const engine::OrderChange& change);

/*
  Pushes engine outcomes to the connected parties.

    offer            -> new_order_request to the candidate
    DRIVER_ASSIGNED  -> order_update to the rider and the accepting driver
    CANCELLED        -> order_update to whichever party did not cancel
    anything else    -> order_update to the rider

  Delivery goes through RealtimeGateway::SendTo and therefore reaches
  connections held by other processes.
*/
class RealtimeNotificationSink final : public engine::NotificationSink {
 public:
  explicit RealtimeNotificationSink(std::shared_ptr<RealtimeGateway> gateway);

  const char* Name() const override {
    return "realtime";
  }

  void OnOffer(const db::model::OrderRecord& order, const engine::Candidate& candidate, uint32_t attempt) override;
  void OnStatusChanged(const engine::OrderChange& change) override;

 private:
  std::shared_ptr<RealtimeGateway> gateway_;
};

} // namespace dispatch::realtime
