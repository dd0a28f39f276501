#include "pch.hpp"

const NonConstructibleTag NonConstructibleTag::TAG{};
