#pragma once

#include <kinema/animation.hpp>
#include <kinema/clip_registry.hpp>
#include <kinema/collaborators.hpp>
#include <kinema/command.hpp>
#include <kinema/config.hpp>
#include <kinema/engine.hpp>
#include <kinema/errors.hpp>
#include <kinema/fwd.hpp>
#include <kinema/logger.hpp>
#include <kinema/properties.hpp>
