#pragma once

#include "core/field.hpp"
#include "core/encoding.hpp"
#include "core/errors.hpp"
#include "core/hash.hpp"
#include "core/types.hpp"
#include "core/seedable_rng.hpp"

#include "crypto/rescue.hpp"
#include "crypto/merkle.hpp"

#include "air/constraints.hpp"
#include "air/layout.hpp"
#include "air/semaphore_air.hpp"

#include "ops/keys.hpp"
#include "ops/backend.hpp"
#include "ops/prover.hpp"
#include "ops/signal.hpp"
#include "ops/access_set.hpp"
#include "ops/registry.hpp"

#include "utils/metrics.hpp"
