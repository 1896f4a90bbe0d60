#pragma once

#include "sparkscope/history/v1/snapshot.pb.h"
#include "sparkscope/history/v1/history_service.pb.h"
#include "sparkscope/history/v1/history_service.grpc.pb.h"
