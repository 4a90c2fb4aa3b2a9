#pragma once

#include "foreman/v1/agent.pb.h"
#include "foreman/v1/notification.pb.h"
#include "foreman/v1/pipeline.pb.h"
#include "foreman/v1/run.pb.h"

#include "foreman/v1/foreman_service.pb.h"
#include "foreman/v1/foreman_service.grpc.pb.h"
