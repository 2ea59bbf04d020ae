#pragma once

namespace helpdesk_api {

// Single-page chat client served at "/". Posts to /api/chat and lists the references.
inline constexpr const char *kChatPageHtml = R"HTML(<!doctype html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>AI Helpdesk</title>
<style>
  body { font-family: sans-serif; max-width: 860px; margin: 2rem auto; padding: 0 1rem; }
  #log { border: 1px solid #ccc; border-radius: 6px; padding: 1rem; min-height: 320px; }
  .msg { margin: 0.75rem 0; white-space: pre-wrap; }
  .user { font-weight: bold; }
  .refs { font-size: 0.85rem; color: #555; margin-left: 1rem; }
  form { display: flex; gap: 0.5rem; margin-top: 1rem; }
  input[type=text] { flex: 1; padding: 0.5rem; }
</style>
</head>
<body>
<h1>AI Helpdesk</h1>
<div id="log"></div>
<form id="ask">
  <input type="text" id="question" placeholder="Ask a question" autocomplete="off">
  <input type="number" id="top_k" min="1" max="20" value="5">
  <button type="submit">Ask</button>
</form>
<script>
const log = document.getElementById('log');

function append(cls, text) {
  const div = document.createElement('div');
  div.className = 'msg ' + cls;
  div.textContent = text;
  log.appendChild(div);
  return div;
}

document.getElementById('ask').addEventListener('submit', async (event) => {
  event.preventDefault();
  const question = document.getElementById('question').value.trim();
  if (!question) return;
  const topK = parseInt(document.getElementById('top_k').value, 10) || 5;
  append('user', question);
  document.getElementById('question').value = '';
  const pending = append('bot', '...');
  try {
    const response = await fetch('/api/chat', {
      method: 'POST',
      headers: { 'Content-Type': 'application/json' },
      body: JSON.stringify({ question: question, top_k: topK })
    });
    const data = await response.json();
    if (!response.ok) {
      pending.textContent = 'Error: ' + (data.error || response.status);
      return;
    }
    pending.textContent = data.answer;
    if (data.references && data.references.length) {
      const refs = document.createElement('ul');
      refs.className = 'refs';
      data.references.forEach((ref) => {
        const li = document.createElement('li');
        li.textContent = ref.citation + ' (score ' + ref.score.toFixed(3) + ')';
        refs.appendChild(li);
      });
      log.appendChild(refs);
    }
  } catch (err) {
    pending.textContent = 'Error: ' + err;
  }
});
</script>
</body>
</html>
)HTML";

}  // namespace helpdesk_api
