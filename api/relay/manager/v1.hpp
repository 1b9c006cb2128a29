#pragma once

#include "relay/manager/v1/types.pb.h"

#include "relay/manager/v1/admin_service.pb.h"

#include "relay/manager/v1/admin_service.grpc.pb.h"
