/*
 * Temporarily override what a callable returns, for one input, a region of inputs or all inputs, for the duration
 * of a scope:
 *
 *    auto f = imagine::wrap([](int x) { return x + 1; }, "f");
 *
 *    f(0);                                  // 1
 *    {
 *        auto outer = f.at(0).imagine(-1).scoped();
 *        f(0);                              // -1
 *        {
 *            auto inner = f.at(0).imagine(-2).scoped();
 *            f(0);                          // -2
 *        }
 *        f(0);                              // -1
 *    }
 *    f(0);                                  // 1
 *
 * The override is not lexically scoped, every caller of f sees it while the scope is open. Overrides for several
 * callables are combined with +, and an activation built earlier can be re-based onto whatever is active with
 * rebase(). Nothing here is synchronised, drive a given callable's activations from one thread only.
 */
#ifndef IMAGINE_H
#define IMAGINE_H

#include <imagine/imagine_base.h>
#include <imagine/runtime/configuration.h>
#include <imagine/runtime/observers/imagination_observer.h>
#include <imagine/runtime/observers/imagination_trace.h>
#include <imagine/types/activation.h>
#include <imagine/types/activation_component.h>
#include <imagine/types/cursor.h>
#include <imagine/types/imagined.h>
#include <imagine/types/scene.h>
#include <imagine/util/errors.h>
#include <imagine/util/scope.h>

#endif // IMAGINE_H
