#pragma once

#include "market/indexer/v1/types.pb.h"
#include "market/indexer/v1/query.pb.h"
#include "market/indexer/v1/query_service.pb.h"
#include "market/indexer/v1/chain_gateway.pb.h"

#if MARKET_GRPC
#include "market/indexer/v1/query_service.grpc.pb.h"
#include "market/indexer/v1/chain_gateway.grpc.pb.h"
#endif
