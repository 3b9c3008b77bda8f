#pragma once

#include <imagine/imagine_base.h>

#include <concepts>
#include <memory>
#include <utility>
#include <vector>

namespace imagine {

    /**
     * @brief Anything that can be entered and exited as a unit: a single target activation or a group of them.
     *
     * enter() and exit() must be paired and nested. The acquire/release pair is normally driven by an
     * ActivationScope so the release happens on every exit path.
     */
    struct IMAGINE_EXPORT ActivationComponent {
        using ptr = ActivationComponent *;
        using s_ptr = std::shared_ptr<ActivationComponent>;

        virtual ~ActivationComponent() = default;

        virtual void enter() = 0;

        virtual void exit() = 0;

        /**
         * A new component whose chains are re-parented onto whatever is active for each target right now.
         */
        [[nodiscard]] virtual s_ptr rebase() const = 0;

        /**
         * Append the single target activations making up this component, depth-first, left-to-right.
         */
        virtual void append_leaves(std::vector<ptr> &leaves) = 0;
    };

    /**
     * The handle types (Activation<Sig>, ActivationGroup) expose the component they drive.
     */
    template<typename T>
    concept ActivationLike = requires(const T &t) {
        { t.component() } -> std::convertible_to<ActivationComponent::s_ptr>;
    };

    /**
     * @brief Enters a component on construction and exits it on destruction.
     *
     * This is the closest equivalent to a with block. The destructor never throws: if exit() fails (which only
     * happens when balance checking detects an out-of-order exit) the error is reported on stderr. Call close() to
     * exit early and have the error propagate.
     */
    class IMAGINE_EXPORT ActivationScope {
    public:
        explicit ActivationScope(ActivationComponent::s_ptr component);

        template<ActivationLike T>
        explicit ActivationScope(const T &activation) : ActivationScope(activation.component()) {}

        ~ActivationScope() noexcept;

        ActivationScope(const ActivationScope &) = delete;
        ActivationScope &operator=(const ActivationScope &) = delete;
        ActivationScope(ActivationScope &&) = delete;
        ActivationScope &operator=(ActivationScope &&) = delete;

        void close();

        [[nodiscard]] bool is_open() const;

    private:
        ActivationComponent::s_ptr _component;
        bool _open{false};
    };

    /**
     * @brief An ordered combination of components.
     *
     * Entering visits the leaves in declared order, exiting visits them in exact reverse order. Activations for the
     * same target must be released in the mirror of their acquisition order or the restored chain will be wrong.
     * Overlapping targets are not rejected; the later entered override wins while active.
     */
    class IMAGINE_EXPORT CompositeActivation final : public ActivationComponent {
    public:
        explicit CompositeActivation(std::vector<s_ptr> components);

        void enter() override;

        void exit() override;

        [[nodiscard]] s_ptr rebase() const override;

        void append_leaves(std::vector<ptr> &leaves) override;

        [[nodiscard]] const std::vector<s_ptr> &components() const;

    private:
        [[nodiscard]] std::vector<ptr> leaves() const;

        std::vector<s_ptr> _components;
    };

    /**
     * @brief Handle over a CompositeActivation, the result of combining activations with combine() or +.
     */
    class IMAGINE_EXPORT ActivationGroup {
    public:
        explicit ActivationGroup(std::vector<ActivationComponent::s_ptr> components);

        void enter();

        void exit();

        [[nodiscard]] ActivationGroup rebase() const;

        [[nodiscard]] ActivationScope scoped() const;

        template<ActivationLike T>
        [[nodiscard]] ActivationGroup combine(const T &other) const {
            return ActivationGroup(std::vector<ActivationComponent::s_ptr>{component(), other.component()});
        }

        /**
         * The number of single target activations in the group.
         */
        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] ActivationComponent::s_ptr component() const;

    private:
        std::shared_ptr<CompositeActivation> _composite;
    };

    template<ActivationLike L, ActivationLike R>
    [[nodiscard]] ActivationGroup operator+(const L &lhs, const R &rhs) {
        return ActivationGroup(std::vector<ActivationComponent::s_ptr>{lhs.component(), rhs.component()});
    }

    /**
     * Run fn with the activation entered, exiting it however fn completes.
     */
    template<ActivationLike T, typename F>
    decltype(auto) imagining(const T &activation, F &&fn) {
        ActivationScope scope{activation};
        return std::forward<F>(fn)();
    }

} // namespace imagine
