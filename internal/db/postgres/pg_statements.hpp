#pragma once

#include <utility>

namespace dispatch::db::postgres {

#define DISPATCH_PG_ORDER_COLUMNS                                                                                              \
  "id,type,status,rider_id,driver_id,pickup_lat,pickup_lng,pickup_address,dropoff_lat,dropoff_lng,dropoff_address,"           \
  "vehicle_class,distance_km,duration_minutes,estimated_fare,final_fare,surge_multiplier,otp,"                                 \
  "recipient_name,recipient_phone,package_description,requested_at_ms,accepted_at_ms,started_at_ms,completed_at_ms,"          \
  "cancelled_at_ms,cancelled_by,cancellation_reason,search_attempts,search_expires_at_ms"

#define DISPATCH_PG_DRIVER_COLUMNS                                                                                             \
  "id,online,availability,vehicle_class,plate,model,color,rating,total_rides,total_deliveries,"                                \
  "has_position,last_lat,last_lng,heading,location_updated_at_ms"

// Prepared on every pooled connection.
inline constexpr std::pair<const char*, const char*> kStatements[] = {
    {"insert_order",
     "INSERT INTO orders(" DISPATCH_PG_ORDER_COLUMNS ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,"
     "$19,$20,$21,$22,$23,$24,$25,$26,$27,$28,$29,$30)"},
    {"get_order", "SELECT " DISPATCH_PG_ORDER_COLUMNS " FROM orders WHERE id=$1"},
    {"update_order_if_status",
     "UPDATE orders SET type=$2,status=$3,rider_id=$4,driver_id=$5,pickup_lat=$6,pickup_lng=$7,pickup_address=$8,"
     "dropoff_lat=$9,dropoff_lng=$10,dropoff_address=$11,vehicle_class=$12,distance_km=$13,duration_minutes=$14,"
     "estimated_fare=$15,final_fare=$16,surge_multiplier=$17,otp=$18,recipient_name=$19,recipient_phone=$20,"
     "package_description=$21,requested_at_ms=$22,accepted_at_ms=$23,started_at_ms=$24,completed_at_ms=$25,"
     "cancelled_at_ms=$26,cancelled_by=$27,cancellation_reason=$28,search_attempts=$29,search_expires_at_ms=$30 "
     "WHERE id=$1 AND status=$31"},
    {"assign_driver_if_pending",
     "UPDATE orders SET status=$1, driver_id=$2, accepted_at_ms=$3, search_expires_at_ms=0 WHERE id=$4 AND status=$5"},
    {"restart_search", "UPDATE orders SET search_expires_at_ms=$1, search_attempts=search_attempts+1 WHERE id=$2 AND status=$3"},
    {"claim_search_expiry",
     "UPDATE orders SET search_expires_at_ms=$1, search_attempts=search_attempts + (CASE WHEN $1 = 0 THEN 0 ELSE 1 END) "
     "WHERE id=$2 AND status=$3 AND search_expires_at_ms=$4"},
    {"order_exists", "SELECT 1 FROM orders WHERE id=$1"},
    {"list_expired_searches",
     "SELECT " DISPATCH_PG_ORDER_COLUMNS
     " FROM orders WHERE status=$1 AND search_expires_at_ms>0 AND search_expires_at_ms<=$2 ORDER BY search_expires_at_ms, id LIMIT $3"},
    {"active_order_for_rider",
     "SELECT " DISPATCH_PG_ORDER_COLUMNS
     " FROM orders WHERE rider_id=$1 AND status NOT IN ($2,$3) ORDER BY requested_at_ms DESC, id DESC LIMIT 1"},
    {"active_order_for_driver",
     "SELECT " DISPATCH_PG_ORDER_COLUMNS
     " FROM orders WHERE driver_id=$1 AND status NOT IN ($2,$3) ORDER BY requested_at_ms DESC, id DESC LIMIT 1"},
    {"orders_for_participant",
     "SELECT " DISPATCH_PG_ORDER_COLUMNS
     " FROM orders WHERE rider_id=$1 OR driver_id=$1 ORDER BY requested_at_ms DESC, id DESC LIMIT $2 OFFSET $3"},
    {"count_orders_for_participant", "SELECT COUNT(*) FROM orders WHERE rider_id=$1 OR driver_id=$1"},
    {"insert_driver",
     "INSERT INTO drivers(" DISPATCH_PG_DRIVER_COLUMNS ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15)"},
    {"get_driver", "SELECT " DISPATCH_PG_DRIVER_COLUMNS " FROM drivers WHERE id=$1"},
    {"update_driver",
     "UPDATE drivers SET online=$2,availability=$3,vehicle_class=$4,plate=$5,model=$6,color=$7,rating=$8,total_rides=$9,"
     "total_deliveries=$10,has_position=$11,last_lat=$12,last_lng=$13,heading=$14,location_updated_at_ms=$15 WHERE id=$1"},
    {"online_drivers_in_box",
     "SELECT " DISPATCH_PG_DRIVER_COLUMNS
     " FROM drivers WHERE online AND has_position AND last_lat BETWEEN $1 AND $2 AND last_lng BETWEEN $3 AND $4"},
    {"driver_assigned_count", "SELECT COUNT(*) FROM order_events WHERE type=$1 AND actor_id=$2"},
    {"driver_completed_totals", "SELECT COUNT(*), COALESCE(SUM(final_fare),0) FROM orders WHERE driver_id=$1 AND status=$2"},
    {"insert_decline", "INSERT INTO order_declines(order_id,driver_id,reason,declined_at_ms) VALUES($1,$2,$3,$4)"},
    {"list_declines", "SELECT order_id,driver_id,reason,declined_at_ms FROM order_declines WHERE order_id=$1 ORDER BY seq"},
    {"insert_order_event", "INSERT INTO order_events(order_id,type,actor_id,has_position,lat,lng,at_ms) VALUES($1,$2,$3,$4,$5,$6,$7)"},
    {"list_order_events",
     "SELECT order_id,type,actor_id,has_position,COALESCE(lat,0),COALESCE(lng,0),at_ms FROM order_events WHERE order_id=$1 ORDER BY at_ms, seq"},
    {"insert_rating", "INSERT INTO ratings(order_id,from_id,to_id,stars,comment,created_at_ms) VALUES($1,$2,$3,$4,$5,$6)"},
    {"list_ratings_for", "SELECT order_id,from_id,to_id,stars,comment,created_at_ms FROM ratings WHERE to_id=$1 ORDER BY created_at_ms"},
};

} // namespace dispatch::db::postgres
