#pragma once

#include "outbox/v1/id.pb.h"
#include "outbox/v1/payload.pb.h"
#include "outbox/v1/types.pb.h"
