#ifndef IMAGINE_FORWARD_DECLARATIONS_H
#define IMAGINE_FORWARD_DECLARATIONS_H

#include <memory>

namespace imagine {
    template<typename Signature> class Scene;
    template<typename Signature> class Cursor;
    template<typename Signature> class Point;
    template<typename Signature> class Region;
    template<typename Signature> class Activation;
    template<typename Signature> class Imagined;
    template<typename Signature> class Retrospect;

    class CursorBase;
    struct ActivationComponent;
    class CompositeActivation;
    class ActivationGroup;
    class ActivationScope;

    struct ImaginationObserver;
    class ObserverRegistry;
    class ImaginationTrace;
    class ImagineConfiguration;

    using activation_component_s_ptr = std::shared_ptr<ActivationComponent>;
    using imagination_observer_s_ptr = std::shared_ptr<ImaginationObserver>;
} // namespace imagine

#endif // IMAGINE_FORWARD_DECLARATIONS_H
