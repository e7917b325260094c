#pragma once
#include <nest/core/logger.hpp>
#include <nest/core/radians.hpp>
#include <nest/core/result.hpp>
#include <nest/graphics/draw_list.hpp>
#include <nest/graphics/rgba.hpp>
#include <nest/graphics/texture.hpp>
#include <nest/resources/image_loader.hpp>
#include <nest/shape/concat.hpp>
#include <nest/shape/rect.hpp>
#include <nest/shape/shape.hpp>
