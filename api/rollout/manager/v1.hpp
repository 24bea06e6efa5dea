#pragma once

#include "rollout/manager/v1/session.pb.h"
#include "rollout/manager/v1/update_service.pb.h"
#include "rollout/manager/v1/update_service.grpc.pb.h"
