// Repository: simcore
// Component: Payload
// Purpose: Umbrella include for the payload value model.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_PAYLOAD_PAYLOAD_HPP_
#define SIMCORE_PAYLOAD_PAYLOAD_HPP_

#include "simcore/payload/Buffers.hpp"
#include "simcore/payload/Containers.hpp"
#include "simcore/payload/Date.hpp"
#include "simcore/payload/Pattern.hpp"
#include "simcore/payload/Value.hpp"

#endif  // SIMCORE_PAYLOAD_PAYLOAD_HPP_
