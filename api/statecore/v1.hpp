#pragma once

#include "statecore/v1/entity.pb.h"
#include "statecore/v1/event.pb.h"
