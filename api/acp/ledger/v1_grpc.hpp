#pragma once

#include "acp/ledger/v1.hpp"

#include "acp/ledger/services/v1/tip_service.grpc.pb.h"
#include "acp/ledger/services/v1/bounty_service.grpc.pb.h"
#include "acp/ledger/services/v1/registry_service.grpc.pb.h"
#include "acp/ledger/services/v1/token_service.grpc.pb.h"
