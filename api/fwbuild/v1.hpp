#pragma once

#include "fwbuild/v1/build.pb.h"
#include "fwbuild/v1/catalog.pb.h"
