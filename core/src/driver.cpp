#include "agentbox/driver.h"

namespace agentbox {

static const char kDriverSource[] = R"PY(
import base64, io, json, os, signal, sys, traceback

_proto_in = os.fdopen(os.dup(0), 'rb', buffering=0)
_proto_out = os.fdopen(os.dup(1), 'wb', buffering=0)
_diag_fd = os.dup(2)
_null_r = os.open(os.devnull, os.O_RDONLY)
_null_w = os.open(os.devnull, os.O_WRONLY)
os.dup2(_null_r, 0)
os.dup2(_null_w, 1)

_I64_MIN, _I64_MAX = -(1 << 63), (1 << 63) - 1
_state = {'busy': False}
_call = {'artifact': None, 'final': False, 'size': None, 'fnv': ''}


class _FinalAnswerSignal(BaseException):
    pass


def _on_sigint(signum, frame):
    if _state['busy']:
        raise KeyboardInterrupt()


signal.signal(signal.SIGINT, _on_sigint)


def _read_exact(n):
    buf = b''
    while len(buf) < n:
        chunk = _proto_in.read(n - len(buf))
        if not chunk:
            raise EOFError()
        buf += chunk
    return buf


def _read_frame():
    header = b''
    while not header.endswith(b'\n'):
        c = _proto_in.read(1)
        if not c:
            raise EOFError()
        header += c
        if len(header) > 32:
            raise ValueError('bad frame header')
    if not header.startswith(b'AGBX '):
        raise ValueError('bad frame header')
    return json.loads(_read_exact(int(header[5:-1])).decode('utf-8'))


def _write_frame(obj):
    data = json.dumps(obj).encode('utf-8')
    view = memoryview(b'AGBX %d\n' % len(data) + data)
    while view:
        n = _proto_out.write(view)
        view = view[n:]


def _fnv1a64(data):
    h = 1469598103934665603
    for b in data:
        h ^= b
        h = (h * 1099511628211) & 0xFFFFFFFFFFFFFFFF
    return format(h, '016x')


def _repr(v):
    try:
        text = repr(v)
    except Exception as e:
        text = '<unrepresentable %s: %s>' % (type(v).__name__, e)
    return {'$type': 'repr', 'type': type(v).__name__, 'text': text}


def _encode_image(v):
    mod = type(v).__module__ or ''
    if not mod.startswith('PIL.') or not hasattr(v, 'save'):
        return None
    buf = io.BytesIO()
    try:
        v.save(buf, format='PNG')
    except Exception:
        return None
    return {'$type': 'image', 'format': 'png', 'data': base64.b64encode(buf.getvalue()).decode('ascii')}


def _encode(v, depth=0):
    if depth > 256:
        return _repr(v)
    if v is None or isinstance(v, bool):
        return v
    if isinstance(v, int):
        return int(v) if _I64_MIN <= v <= _I64_MAX else _repr(v)
    if isinstance(v, float):
        return float(v)
    if isinstance(v, str):
        return str(v)
    if isinstance(v, (bytes, bytearray)):
        return {'$type': 'bytes', 'data': base64.b64encode(bytes(v)).decode('ascii')}
    if isinstance(v, (list, tuple)):
        return [_encode(x, depth + 1) for x in v]
    if isinstance(v, dict):
        if not all(isinstance(k, str) for k in v):
            return _repr(v)
        entries = {k: _encode(x, depth + 1) for k, x in v.items()}
        if '$type' in entries:
            return {'$type': 'map', 'entries': entries}
        return entries
    img = _encode_image(v)
    if img is not None:
        return img
    return _repr(v)


def _decode(v):
    if isinstance(v, list):
        return [_decode(x) for x in v]
    if not isinstance(v, dict):
        return v
    t = v.get('$type')
    if t is None:
        return {k: _decode(x) for k, x in v.items()}
    if t == 'map':
        return {k: _decode(x) for k, x in v['entries'].items()}
    if t == 'bytes':
        return base64.b64decode(v['data'])
    if t == 'image':
        raw = base64.b64decode(v['data'])
        try:
            from PIL import Image
            return Image.open(io.BytesIO(raw))
        except Exception:
            return raw
    if t == 'repr':
        return v['text']
    raise ValueError('unknown $type %r' % (t,))


def _emit(value):
    path = _call['artifact']
    data = json.dumps(_encode(value)).encode('utf-8')
    part = path + '.part'
    with open(part, 'wb') as f:
        f.write(data)
        f.flush()
        os.fsync(f.fileno())
    os.replace(part, path)
    _call['size'] = len(data)
    _call['fnv'] = _fnv1a64(data)


def __agentbox_final__(value):
    _emit(value)
    _call['final'] = True
    raise _FinalAnswerSignal()


def __agentbox_fetch__(name):
    if name not in _ns:
        raise NameError("name '%s' is not defined" % name)
    _emit(_ns[name])


def __agentbox_load_state__(path):
    with open(path, 'rb') as f:
        data = json.loads(f.read().decode('utf-8'))
    return {k: _decode(v) for k, v in data.items()}


def __agentbox_pip__(args):
    import subprocess
    r = subprocess.run([sys.executable, '-m', 'pip', 'install'] + list(args),
                       stdout=subprocess.PIPE, stderr=subprocess.STDOUT)
    sys.stdout.write(r.stdout.decode('utf-8', 'replace'))
    if r.returncode != 0:
        raise SystemExit(r.returncode)


_ns = {
    '__name__': '__main__',
    '__builtins__': __builtins__,
    'final_answer': __agentbox_final__,
    '__agentbox_final__': __agentbox_final__,
    '__agentbox_fetch__': __agentbox_fetch__,
    '__agentbox_load_state__': __agentbox_load_state__,
    '__agentbox_pip__': __agentbox_pip__,
}


def _format_error(e):
    tb = e.__traceback__
    if tb is not None and tb.tb_next is not None:
        tb = tb.tb_next
    return ''.join(traceback.format_exception(type(e), e, tb))


def _run(req):
    _call.update(artifact=req.get('artifact'), final=False, size=None, fnv='')
    out = {'op': 'done', 'id': req.get('id'), 'ok': True, 'error': '', 'error_type': '',
           'final': False, 'artifact_size': None, 'artifact_fnv': ''}
    fd = os.open(req['capture'], os.O_WRONLY | os.O_CREAT | os.O_TRUNC, 0o644)
    os.fchmod(fd, 0o644)
    try:
        os.dup2(fd, 1)
        os.dup2(fd, 2)
        _state['busy'] = True
        try:
            exec(compile(req.get('code', ''), '<agentbox>', 'exec'), _ns)
        finally:
            _state['busy'] = False
    except _FinalAnswerSignal:
        pass
    except SystemExit as e:
        if e.code not in (None, 0):
            out['ok'] = False
            out['error_type'] = 'SystemExit'
            out['error'] = 'SystemExit: %s\n' % (e.code,)
    except BaseException as e:
        out['ok'] = False
        out['error_type'] = type(e).__name__
        out['error'] = _format_error(e)
    finally:
        _state['busy'] = False
        try:
            sys.stdout.flush()
            sys.stderr.flush()
        except Exception:
            pass
        os.dup2(_null_w, 1)
        os.dup2(_diag_fd, 2)
        os.close(fd)
    out['final'] = _call['final']
    out['artifact_size'] = _call['size']
    out['artifact_fnv'] = _call['fnv']
    return out


def _main():
    _write_frame({'op': 'ready', 'pid': os.getpid(), 'python': sys.version.split()[0]})
    while True:
        try:
            req = _read_frame()
        except EOFError:
            return
        op = req.get('op')
        if op == 'shutdown':
            return
        if op == 'exec':
            _write_frame(_run(req))
        else:
            _write_frame({'op': 'error', 'error': 'unknown op %r' % (op,)})


_main()
)PY";

const char* guest_driver_source() {
    return kDriverSource;
}

} // namespace agentbox
