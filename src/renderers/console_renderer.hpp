#ifndef COURIER_CONSOLE_RENDERER_HPP
#define COURIER_CONSOLE_RENDERER_HPP

#include <ostream>
#include <string>

#include "interface.hpp"

namespace renderers {
    // Raw request/response text, one exchange per render() call.
    class ConsoleRenderer : public IRenderer {
       public:
        explicit ConsoleRenderer(std::ostream& out);

        void render(const courier::ExecutionResult& result) override;

        [[nodiscard]] static std::string format(const courier::ExecutionResult& result);

       private:
        std::ostream& out_;
    };
}  // namespace renderers

#endif
