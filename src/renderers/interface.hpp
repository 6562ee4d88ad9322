#ifndef COURIER_RENDERER_INTERFACE_HPP
#define COURIER_RENDERER_INTERFACE_HPP

#include "../courier/executor/execution_result.hpp"

namespace renderers {
    class IRenderer {
       public:
        IRenderer() = default;
        virtual ~IRenderer() = default;
        IRenderer(const IRenderer&) = delete;
        IRenderer& operator=(const IRenderer&) = delete;
        IRenderer(IRenderer&&) = delete;
        IRenderer& operator=(IRenderer&&) = delete;

        virtual void render(const courier::ExecutionResult& result) = 0;
    };
}  // namespace renderers

#endif
