#pragma once

#include "bidsub/v1/bid.pb.h"
#include "bidsub/v1/job.pb.h"
#include "bidsub/v1/types.pb.h"
