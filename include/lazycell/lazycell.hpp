#pragma once
#include "instance.hpp"
#include "local.hpp"
