#include "proto_mapping.hpp"

namespace market::model {

namespace {

util::TimePoint TimeOrZero(bool has, const google::protobuf::Timestamp& ts) {
  return has ? util::FromProto(ts) : util::TimePoint{};
}

} // namespace

pb::Admin ToProto(const Admin& admin) {
  pb::Admin msg;
  msg.set_index(admin.index);
  msg.set_address(admin.address);
  *msg.mutable_last_sync() = util::ToProto(admin.last_sync);
  msg.set_category(admin.category);
  msg.set_nickname(admin.nickname);
  msg.set_about(admin.about);
  msg.set_can_approve_user(admin.can_approve_user);
  msg.set_can_revoke_user(admin.can_revoke_user);
  msg.set_revoked(admin.revoked);
  return msg;
}

pb::UserStatus ToProto(UserStatus status) {
  switch (status) {
    case UserStatus::Moderation:
      return pb::USER_STATUS_MODERATION;
    case UserStatus::Active:
      return pb::USER_STATUS_ACTIVE;
    case UserStatus::Banned:
      return pb::USER_STATUS_BANNED;
  }
  return pb::USER_STATUS_MODERATION;
}

pb::User ToProto(const User& user) {
  pb::User msg;
  msg.set_index(user.index);
  msg.set_address(user.address);
  *msg.mutable_last_sync() = util::ToProto(user.last_sync);
  msg.set_status(ToProto(user.status));
  msg.set_nickname(user.nickname);
  msg.set_language(user.language);
  msg.set_specialization(user.specialization);
  msg.set_telegram(user.telegram);
  msg.set_portfolio(user.portfolio);
  msg.set_resume(user.resume);
  msg.set_about(user.about);
  if (user.about_hash) msg.set_about_hash(*user.about_hash);
  *msg.mutable_created_at() = util::ToProto(user.created_at);
  if (user.about_translated) msg.set_about_translated(*user.about_translated);
  return msg;
}

pb::Order ToProto(const Order& order) {
  pb::Order msg;
  msg.set_index(order.index);
  msg.set_address(order.address);
  *msg.mutable_last_sync() = util::ToProto(order.last_sync);
  msg.set_status(order.status);
  msg.set_category(order.category);
  msg.set_language(order.language);
  msg.set_customer_address(order.customer_address);
  msg.set_freelancer_address(order.freelancer_address);

  msg.set_name(order.name);
  if (order.name_hash) msg.set_name_hash(*order.name_hash);
  msg.set_description(order.description);
  if (order.description_hash) msg.set_description_hash(*order.description_hash);
  msg.set_technical_task(order.technical_task);
  if (order.technical_task_hash) msg.set_technical_task_hash(*order.technical_task_hash);

  msg.set_price(order.price);
  *msg.mutable_deadline()   = util::ToProto(order.deadline);
  *msg.mutable_created_at() = util::ToProto(order.created_at);
  msg.set_responses_count(order.responses_count);
  msg.set_arbitration_freelancer_part(order.arbitration_freelancer_part);

  if (order.name_translated) msg.set_name_translated(*order.name_translated);
  if (order.description_translated) msg.set_description_translated(*order.description_translated);
  if (order.technical_task_translated) msg.set_technical_task_translated(*order.technical_task_translated);

  if (order.customer) *msg.mutable_customer() = ToProto(*order.customer);
  if (order.freelancer) *msg.mutable_freelancer() = ToProto(*order.freelancer);
  return msg;
}

pb::OrderResponse ToProto(const OrderResponse& response) {
  pb::OrderResponse msg;
  msg.set_order_index(response.order_index);
  msg.set_freelancer_address(response.freelancer_address);
  msg.set_text(response.text);
  msg.set_price(response.price);
  *msg.mutable_timestamp() = util::ToProto(response.timestamp);
  return msg;
}

pb::OrderActivity ToProto(const OrderActivity& activity) {
  pb::OrderActivity msg;
  msg.set_id(activity.id);
  msg.set_order_index(activity.order_index);
  msg.set_sender_address(activity.sender_address);
  msg.set_op_code(activity.op_code);
  msg.set_amount(activity.amount);
  msg.set_tx_hash(activity.tx_hash);
  *msg.mutable_timestamp() = util::ToProto(activity.timestamp);
  return msg;
}

pb::Category ToProto(const Category& category) {
  pb::Category msg;
  msg.set_hash(category.hash);
  msg.set_name(category.name);
  msg.set_is_active(category.is_active);
  return msg;
}

pb::Language ToProto(const Language& language) {
  pb::Language msg;
  msg.set_hash(language.hash);
  msg.set_name(language.name);
  msg.set_is_active(language.is_active);
  return msg;
}

void FromProto(const pb::Admin& msg, Admin& admin) {
  admin.last_sync        = TimeOrZero(msg.has_last_sync(), msg.last_sync());
  admin.category         = msg.category();
  admin.nickname         = msg.nickname();
  admin.about            = msg.about();
  admin.can_approve_user = msg.can_approve_user();
  admin.can_revoke_user  = msg.can_revoke_user();
  admin.revoked          = msg.revoked();
}

void FromProto(const pb::User& msg, User& user) {
  user.last_sync      = TimeOrZero(msg.has_last_sync(), msg.last_sync());
  user.status         = UserStatusFromInt(msg.status()).value_or(UserStatus::Moderation);
  user.nickname       = msg.nickname();
  user.language       = msg.language();
  user.specialization = msg.specialization();
  user.telegram       = msg.telegram();
  user.portfolio      = msg.portfolio();
  user.resume         = msg.resume();
  user.about          = msg.about();
  user.about_hash     = msg.has_about_hash() ? std::optional<Hash>(msg.about_hash()) : std::nullopt;
  user.created_at     = TimeOrZero(msg.has_created_at(), msg.created_at());
}

void FromProto(const pb::Order& msg, Order& order) {
  order.last_sync          = TimeOrZero(msg.has_last_sync(), msg.last_sync());
  order.status             = msg.status();
  order.category           = msg.category();
  order.language           = msg.language();
  order.customer_address   = msg.customer_address();
  order.freelancer_address = msg.freelancer_address();

  order.name                = msg.name();
  order.name_hash           = msg.has_name_hash() ? std::optional<Hash>(msg.name_hash()) : std::nullopt;
  order.description         = msg.description();
  order.description_hash    = msg.has_description_hash() ? std::optional<Hash>(msg.description_hash()) : std::nullopt;
  order.technical_task      = msg.technical_task();
  order.technical_task_hash = msg.has_technical_task_hash() ? std::optional<Hash>(msg.technical_task_hash()) : std::nullopt;

  order.price                       = msg.price();
  order.deadline                    = TimeOrZero(msg.has_deadline(), msg.deadline());
  order.created_at                  = TimeOrZero(msg.has_created_at(), msg.created_at());
  order.responses_count             = msg.responses_count();
  order.arbitration_freelancer_part = msg.arbitration_freelancer_part();
}

} // namespace market::model
