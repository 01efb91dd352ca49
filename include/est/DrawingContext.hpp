//
// Created by chris on 1/15/26.
//

#ifndef ESTRENDER_DRAWINGCONTEXT_HPP
#define ESTRENDER_DRAWINGCONTEXT_HPP
#include "DrawBatcher.hpp"

namespace est
{

class RenderPass;

/**
 * @brief Immediate mode 2D drawing session on a render pass
 *
 * Positions are given in pixels of the pass. end() uploads the batched geometry into
 * the context's shared drawing buffers and records one indexed draw per queue on the
 * pass. Going out of scope ends the session unless an exception is unwinding.
 *
 * The pass keeps the last drawing shader and buffers bound afterwards. Blend states,
 * viewport, scissor and index format of the pass are restored.
 */
class DrawingContext : public DrawBatcher
{
public:
	DrawingContext(DrawingContext&& other) noexcept;
	DrawingContext& operator=(DrawingContext&&) = delete;
	~DrawingContext() noexcept(false);

	/// Upload and record the session. An empty session records nothing. Fatal the second time.
	void end();

	[[nodiscard]] bool is_ended() const { return m_ended; }

private:
	friend class RenderPass;
	explicit DrawingContext(RenderPass& pass);

	void replay(const std::vector<DrawingQueue>& queues);

	RenderPass* m_pass;
	bool		m_ended = false;
	int			m_exceptions;
};

} // namespace est

#endif // ESTRENDER_DRAWINGCONTEXT_HPP
