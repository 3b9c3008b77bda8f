/*
 * The core imports for imagine. Use this to ensure the correct import order can be maintained.
 */

#ifndef IMAGINE_BASE_H
#define IMAGINE_BASE_H

#include <fmt/format.h>

#include <imagine/imagine_export.h>
#include <imagine/imagine_forward_declarations.h>

#endif // IMAGINE_BASE_H
