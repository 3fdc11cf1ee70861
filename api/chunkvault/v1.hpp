#pragma once

#include "chunkvault/v1/types.pb.h"
#include "chunkvault/v1/vault_service.pb.h"
#include "chunkvault/v1/vault_service.grpc.pb.h"
