#pragma once

#include "internal/model/entities.hpp"
#include "market/indexer/v1.hpp"

namespace market::model {

/*
  Conversions between entities and market.indexer.v1 messages.

  ToProto carries the derived fields too (translations, linked
  customer/freelancer). FromProto reads contract fields and last_sync
  only; identity and derived fields are left to the caller.
*/

namespace pb = market::indexer::v1;

pb::Admin         ToProto(const Admin& admin);
pb::User          ToProto(const User& user);
pb::Order         ToProto(const Order& order);
pb::OrderResponse ToProto(const OrderResponse& response);
pb::OrderActivity ToProto(const OrderActivity& activity);
pb::Category      ToProto(const Category& category);
pb::Language      ToProto(const Language& language);

pb::UserStatus ToProto(UserStatus status);

void FromProto(const pb::Admin& msg, Admin& admin);
void FromProto(const pb::User& msg, User& user);
void FromProto(const pb::Order& msg, Order& order);

} // namespace market::model
