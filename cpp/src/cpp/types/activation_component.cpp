#include <imagine/types/activation_component.h>

#include <cstdio>
#include <exception>

namespace imagine {

    ActivationScope::ActivationScope(ActivationComponent::s_ptr component) : _component{std::move(component)} {
        _component->enter();
        _open = true;
    }

    ActivationScope::~ActivationScope() noexcept {
        if (!_open) { return; }
        // Destructors must not throw. The restore itself has already happened by the time exit() can fail, so all
        // that is lost here is the report, send it to stderr instead.
        try {
            close();
        } catch (const std::exception &e) {
            fprintf(stderr, "Warning: exception while leaving an activation scope: %s\n", e.what());
        } catch (...) {
            fprintf(stderr, "Warning: unknown exception while leaving an activation scope\n");
        }
    }

    void ActivationScope::close() {
        if (!_open) { return; }
        _open = false;
        _component->exit();
    }

    bool ActivationScope::is_open() const { return _open; }

    CompositeActivation::CompositeActivation(std::vector<s_ptr> components) : _components{std::move(components)} {}

    void CompositeActivation::enter() {
        auto leaves_{leaves()};
        std::size_t entered{0};
        try {
            for (; entered < leaves_.size(); ++entered) { leaves_[entered]->enter(); }
        } catch (...) {
            // Leave the targets as we found them before reporting the failure
            while (entered > 0) { leaves_[--entered]->exit(); }
            throw;
        }
    }

    void CompositeActivation::exit() {
        auto leaves_{leaves()};
        // Every leaf must be released even if an earlier one reports a problem, the first problem wins
        std::exception_ptr error;
        for (auto it = leaves_.rbegin(); it != leaves_.rend(); ++it) {
            try {
                (*it)->exit();
            } catch (...) {
                if (!error) { error = std::current_exception(); }
            }
        }
        if (error) { std::rethrow_exception(error); }
    }

    ActivationComponent::s_ptr CompositeActivation::rebase() const {
        std::vector<s_ptr> rebased;
        for (auto leaf : leaves()) { rebased.push_back(leaf->rebase()); }
        return std::make_shared<CompositeActivation>(std::move(rebased));
    }

    void CompositeActivation::append_leaves(std::vector<ptr> &leaves) {
        for (const auto &component : _components) { component->append_leaves(leaves); }
    }

    const std::vector<ActivationComponent::s_ptr> &CompositeActivation::components() const { return _components; }

    std::vector<ActivationComponent::ptr> CompositeActivation::leaves() const {
        std::vector<ptr> result;
        for (const auto &component : _components) { component->append_leaves(result); }
        return result;
    }

    ActivationGroup::ActivationGroup(std::vector<ActivationComponent::s_ptr> components)
        : _composite{std::make_shared<CompositeActivation>(std::move(components))} {}

    void ActivationGroup::enter() { _composite->enter(); }

    void ActivationGroup::exit() { _composite->exit(); }

    ActivationGroup ActivationGroup::rebase() const {
        auto rebased{std::static_pointer_cast<CompositeActivation>(_composite->rebase())};
        return ActivationGroup(rebased->components());
    }

    ActivationScope ActivationGroup::scoped() const { return ActivationScope{component()}; }

    std::size_t ActivationGroup::size() const {
        std::vector<ActivationComponent::ptr> leaves;
        _composite->append_leaves(leaves);
        return leaves.size();
    }

    ActivationComponent::s_ptr ActivationGroup::component() const { return _composite; }

} // namespace imagine
