#pragma once

#include "jobmeter/errors/v1/errors.pb.h"
#include "jobmeter/jobs/v1/history.pb.h"
#include "jobmeter/jobs/v1/job.pb.h"
#include "jobmeter/modules/v1/modules.pb.h"
#include "jobmeter/usage/v1/usage.pb.h"

namespace jobmeter::v1 {
using namespace ::jobmeter::errors::v1;
using namespace ::jobmeter::jobs::v1;
using namespace ::jobmeter::modules::v1;
using namespace ::jobmeter::usage::v1;
}
